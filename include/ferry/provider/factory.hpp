#pragma once

#include <ferry/config/settings.hpp>
#include <ferry/provider/provider.hpp>

#include <memory>

namespace ferry::provider {

/// Backend named by `[source] provider`. Throws std::invalid_argument for an
/// unknown name or a backend this build does not include.
std::unique_ptr<source_catalog> make_source(
    const ferry::config::settings& settings);

/// Backend named by `[destination] provider`. Same failure modes as
/// make_source().
std::unique_ptr<destination_store> make_destination(
    const ferry::config::settings& settings);

/// True when the s3 backend was compiled in.
bool has_s3_support();

}  // namespace ferry::provider
