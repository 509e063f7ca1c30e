#pragma once

namespace transferkit::detail {

// Runs curl_global_init once per process and registers the matching cleanup.
void ensureCurlInitialized();

} // namespace transferkit::detail
