#pragma once

/// @file relpack.hpp
/// @brief Main header for relpack - includes the release packaging components
///
/// Usage:
/// @code
/// #include <relpack.hpp>
///
/// int main() {
///     auto settings = relpack::Settings::resolve();
///     relpack::Logger log;
///     relpack::ProcessRunner runner(&log);
///     relpack::ReleasePackager packager(settings, runner, log);
///     return packager.run_cross({});
/// }
/// @endcode

#include "relpack/exceptions.hpp"
#include "relpack/logging.hpp"
#include "relpack/settings.hpp"
#include "relpack/target.hpp"
#include "relpack/types.hpp"
#include "relpack/version.hpp"

#include "relpack/bundle.hpp"
#include "relpack/fetch.hpp"
#include "relpack/packager.hpp"
#include "relpack/toolchain.hpp"
