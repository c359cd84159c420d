/**
 * @file atomic_file.hpp
 * @brief Crash-safe replace-on-success file mutation.
 */

#ifndef BINDER_ATOMIC_FILE_HPP
#define BINDER_ATOMIC_FILE_HPP

#include <filesystem>
#include <functional>
#include <string_view>

namespace binder {

/**
 * @brief Writes content for a target path into a scratch file.
 *
 * The producer receives the scratch path and must write the complete new
 * content there. Throwing aborts the replacement.
 */
using FileProducer = std::function<void(const std::filesystem::path& scratch)>;

/// @return The scratch path used for @p target: same directory, name + @p suffix.
std::filesystem::path scratch_path_for(const std::filesystem::path& target,
                                       std::string_view suffix = ".tmp");

/**
 * @brief Replace @p target with content produced by @p producer, atomically.
 *
 * @details The producer writes into a scratch file next to the target (same
 * filesystem), which is then renamed over the target. The target is
 * therefore either untouched or fully replaced. If the producer throws,
 * writes nothing, or writes an empty file, the scratch file is removed and
 * the exception propagates. Removal is gated by an ownership flag, not by
 * probing the file system.
 *
 * @param target File to create or replace.
 * @param producer Callback writing the new content.
 * @param suffix Scratch name suffix.
 * @throws Error(ErrorKind::Path) if the target directory is missing or the
 * rename fails; Error(ErrorKind::Processing) if nothing usable was produced;
 * anything the producer throws.
 */
void atomic_replace(const std::filesystem::path& target,
                    const FileProducer& producer,
                    std::string_view suffix = ".tmp");

/**
 * @brief Copy @p source onto @p target through atomic_replace().
 */
void atomic_copy(const std::filesystem::path& source,
                 const std::filesystem::path& target);

} // namespace binder

#endif // BINDER_ATOMIC_FILE_HPP
