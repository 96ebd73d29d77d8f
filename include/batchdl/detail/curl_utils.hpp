#pragma once

namespace batchdl::detail {

// Runs curl_global_init once per process. Throws Error(Internal) on failure;
// a later call retries.
void ensureCurlInitialized();

} // namespace batchdl::detail
