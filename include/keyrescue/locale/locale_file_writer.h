#pragma once

#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without including it

#include <keyrescue/concurrency/file_mutex.h>
#include <keyrescue/concurrency/operation_lock_manager.h>
#include <keyrescue/core/types.h>

#include <filesystem>
#include <map>
#include <string>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

namespace keyrescue::locale {

/**
 * @brief Single entry point for mutating locale files.
 *
 * Each applyUpdates() holds the operation file lock and the path's FileMutex
 * around one fresh read, the in-memory edits and one write.
 */
class LocaleFileWriter {
public:
    LocaleFileWriter(concurrency::OperationLockManager& locks, concurrency::FileMutex& mutex,
                     boost::asio::any_io_executor blockingExecutor);

    /**
     * @brief Set every dotted key in @p updates to its value.
     *
     * A missing or unparsable file is treated as an empty object. Keys whose
     * path is blocked by a non-object value are skipped and logged.
     * @return OperationInProgress when another holder has the file locked,
     *         WriteError when the file cannot be written.
     */
    boost::asio::awaitable<Result<void>> applyUpdates(std::filesystem::path path,
                                                      std::map<std::string, std::string> updates,
                                                      concurrency::OperationType holder);

private:
    concurrency::OperationLockManager& locks_;
    concurrency::FileMutex& mutex_;
    boost::asio::any_io_executor blockingExecutor_;
};

} // namespace keyrescue::locale
