#pragma once

#include "unistore/core/cancellation.hpp"
#include "unistore/storage/backend.hpp"
#include "unistore/storage_config.hpp"

namespace unistore {

/// Run one migration described by `config`: build the backends, then
/// transfer (or purge) with metrics wired in when a metrics file is set.
///
/// Throws StorageError(InvalidArgument) for an invalid configuration and
/// propagates listing failures. Per-item failures and early stops are
/// reported through the returned summary. The config's timeout is applied on
/// top of `cancel`.
BulkSummary run_migration(const MigrationConfig& config,
                          const CancellationToken& cancel = {},
                          const ErrorObserver& on_error = {});

}  // namespace unistore
