#include "transferkit/curl_transport.hpp"
#include "transferkit/fetcher.hpp"
#include "transferkit/transfer_manager.hpp"

#include "cli/progress_panel.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

namespace {

volatile std::sig_atomic_t interrupted = 0;

extern "C" void onInterrupt(int) { interrupted = 1; }

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName << " [-d <directory>] [-v|-q] <command> <url> [args]" << std::endl;
    std::cerr << "Commands:\n"
              << "  fetch <url>                          Print the response body\n"
              << "  download <url>                       Save the resource into the download directory\n"
              << "  upload <url> <file> [<content-type>] POST the file and print the response status\n"
              << "Options:\n"
              << "  -d <directory>   Set download directory (default: current directory)\n"
              << "  -v               Verbose logging\n"
              << "  -q               Log errors only\n"
              << "  -h, --help       Show this message" << std::endl;
}

std::string readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Cannot open " + path.string());
    }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

int exitCodeFor(const transferkit::TransferResult& result) {
    if (result.ok()) {
        return 0;
    }
    return result.error && result.error->kind == transferkit::ErrorKind::Cancelled ? 130 : 1;
}

// Redraws the panel until the stream ends; SIGINT cancels the transfer.
transferkit::TransferResult follow(transferkit::TransferManager& manager,
                                   transferkit::TransferKind kind,
                                   const transferkit::TransferStream& stream,
                                   const std::string& url) {
    transferkit::cli::ProgressPanel panel(std::cout);
    transferkit::TaskSnapshot last;
    last.kind = kind;
    last.url = url;

    const auto result = stream.result();
    while (result.wait_for(std::chrono::milliseconds(200)) != std::future_status::ready) {
        if (interrupted) {
            manager.cancel(kind);
        }
        if (auto snapshot = manager.activeTask(kind)) {
            last = std::move(*snapshot);
        }
        panel.render({last});
    }

    const auto& outcome = result.get();
    if (outcome.ok()) {
        last.state = transferkit::TransferState::Completed;
        last.fraction = 1.0;
    } else {
        last.state = outcome.error && outcome.error->kind == transferkit::ErrorKind::Cancelled
                         ? transferkit::TransferState::Cancelled
                         : transferkit::TransferState::Failed;
        last.error = outcome.error;
    }
    panel.render({last});
    return outcome;
}

int runFetch(const transferkit::Fetcher& fetcher, const std::string& url) {
    const auto body = fetcher.fetchRaw(url);
    const auto document = nlohmann::json::parse(body, nullptr, false);
    if (document.is_discarded()) {
        std::cout << body;
    } else {
        std::cout << document.dump(2) << std::endl;
    }
    return 0;
}

int runDownload(transferkit::TransferManager& manager, const std::string& url) {
    const auto stream = manager.startDownload(url);
    const auto result = follow(manager, transferkit::TransferKind::Download, stream, url);
    if (const auto* path = result.file()) {
        std::cout << "Saved to " << path->string() << std::endl;
    } else if (result.error) {
        std::cerr << "Download failed: " << result.error->message() << std::endl;
    }
    return exitCodeFor(result);
}

int runUpload(transferkit::TransferManager& manager, const std::string& url,
              const std::filesystem::path& file, std::string content_type) {
    auto body = transferkit::binaryBody(readFile(file), std::move(content_type));
    const auto stream = manager.startUpload(url, std::move(body));
    const auto result = follow(manager, transferkit::TransferKind::Upload, stream, url);
    if (const auto* response = result.response()) {
        std::cout << "HTTP " << response->status_code << std::endl;
        for (const auto& [name, value] : response->headers) {
            std::cout << name << ": " << value << std::endl;
        }
    } else if (result.error) {
        std::cerr << "Upload failed: " << result.error->message() << std::endl;
    }
    return exitCodeFor(result);
}

} // namespace

int main(int argc, char** argv) {
    try {
        spdlog::cfg::load_env_levels();
        std::filesystem::path download_dir = std::filesystem::current_path();
        int arg_index = 1;

        while (arg_index < argc && argv[arg_index][0] == '-') {
            const std::string option = argv[arg_index];

            if (option == "-d") {
                if (arg_index + 1 >= argc) {
                    printUsage(argv[0]);
                    return 1;
                }

                download_dir = argv[arg_index + 1];
                std::error_code ec;
                std::filesystem::create_directories(download_dir, ec);
                if (ec) {
                    throw std::runtime_error("Failed to create download directory: "
                         + download_dir.string() + " - " + ec.message());
                }
                arg_index += 2;
            } else if (option == "-v") {
                spdlog::set_level(spdlog::level::debug);
                ++arg_index;
            } else if (option == "-q") {
                spdlog::set_level(spdlog::level::err);
                ++arg_index;
            } else if (option == "-h" || option == "--help") {
                printUsage(argv[0]);
                return 0;
            } else {
                printUsage(argv[0]);
                return 1;
            }
        }

        if (argc - arg_index < 2) {
            printUsage(argv[0]);
            return 1;
        }

        const std::string command = argv[arg_index];
        const std::string url = argv[arg_index + 1];
        const int extra = argc - arg_index - 2;

        // Spooling next to the destination keeps the final move a same-filesystem rename.
        transferkit::CurlTransport::Options options;
        options.spool_directory = download_dir / ".transferkit-spool";
        auto transport = std::make_shared<transferkit::CurlTransport>(options);

        std::signal(SIGINT, onInterrupt);

        if (command == "fetch" && extra == 0) {
            transferkit::Fetcher fetcher(transport);
            return runFetch(fetcher, url);
        }
        if (command == "download" && extra == 0) {
            transferkit::TransferManager manager(transport, download_dir);
            return runDownload(manager, url);
        }
        if (command == "upload" && (extra == 1 || extra == 2)) {
            transferkit::TransferManager manager(transport, download_dir);
            std::string content_type = extra == 2 ? argv[arg_index + 3] : "application/octet-stream";
            return runUpload(manager, url, argv[arg_index + 2], std::move(content_type));
        }

        printUsage(argv[0]);
        return 1;
    } catch (const transferkit::TransferException& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
}
