/**
 * @file structure_detector.hpp
 * @brief Guesses the shape of an input folder tree.
 */

#ifndef BINDER_STRUCTURE_DETECTOR_HPP
#define BINDER_STRUCTURE_DETECTOR_HPP

#include "config.hpp"
#include "job.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace binder {

enum class StructureVariant {
    TwoLevel,   ///< Sections with documents (event plans)
    ThreeLevel, ///< Categories, subjects, documents (education plans)
    Unknown     ///< No confident match; every directory becomes a level-1 section
};

const char* to_string(StructureVariant variant) noexcept;

/**
 * @brief Scan figures and scores behind a detection.
 */
struct DetectionEvidence {
    double education_score = 0.0; ///< Score of the three-level shape
    double event_score = 0.0;     ///< Score of the two-level shape
    int main_dir_count = 0;
    int root_file_count = 0;
    int total_files = 0;
    int max_depth = 1;
    double root_file_ratio = 0.0;
};

/**
 * @brief Result of StructureDetector::detect().
 */
struct FolderStructure {
    StructureVariant variant = StructureVariant::Unknown;
    double confidence = 0.0;          ///< |education - event| / (education + event)
    DetectionEvidence evidence;
    std::vector<std::string> issues;  ///< Human readable remarks, logged only
    int max_depth = 10;               ///< Deepest directory level visited when collecting

    /**
     * @brief Heading level of a directory at @p depth (1 = child of the root).
     * @return The level, or 0 if the directory's contents are inlined into its parent.
     */
    [[nodiscard]] int level_for_depth(int depth) const noexcept;
};

/**
 * @brief Scores a folder tree against the two known plan shapes.
 *
 * @details Entries starting with '.' or '~', "__pycache__" and names
 * containing a cover keyword are not counted. Symbolic links are never
 * followed. A tree with no files, or a confidence below
 * Config::confidence_threshold, yields StructureVariant::Unknown.
 */
class StructureDetector {
public:
    explicit StructureDetector(const Config& config);

    /**
     * @brief Analyze @p root.
     * @throws Error(ErrorKind::Path) if @p root is not a readable directory.
     */
    [[nodiscard]] FolderStructure detect(const std::filesystem::path& root) const;

    /// @return A structure forced by the caller; PlanHint::Auto runs detect().
    [[nodiscard]] FolderStructure resolve(const std::filesystem::path& root, PlanHint hint) const;

private:
    Config config_;
};

} // namespace binder

#endif // BINDER_STRUCTURE_DETECTOR_HPP
