//
//  sync_map.hpp
//  SyncForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "sync_map_fragment.hpp"
#include "sync_map_parameters.hpp"
#include "sync_map_status.hpp"
#include "tree.hpp"

namespace syncforge {

/// @defgroup api SyncForge Public API
/// Public, supported C++ interfaces for building, reading and writing sync maps.
/// @{

/**
 * @brief A synchronization map: a tree of SyncMapFragment objects.
 *
 * The root node carries no payload. Top-level fragments are the root's non-empty children in
 * document order. A SyncMap is meant for one caller at a time; it does no locking.
 */
class SyncMap {
   public:
    using FragmentTree = Tree<SyncMapFragment>;

    explicit SyncMap(RunConfiguration rconf = {});

    /// Add fragment as the last (or first) child of the root. Fails with InvalidArgument
    /// when fragment is null; the tree is left untouched.
    SyncMapStatus add_fragment(SyncMapFragmentPtr fragment, bool as_last = true);

    /// Remove all fragments; the tree is reset to a bare root.
    void clear();

    /// Top-level fragments, recomputed on every call.
    std::vector<SyncMapFragment *> fragments();
    std::vector<const SyncMapFragment *> fragments() const;

    /// Number of top-level fragments.
    size_t size() const;
    bool empty() const;

    /// True if no listed fragment has fragments below it. Equals tree height <= 2 unless
    /// payload-less nodes are present, which do not count as a level.
    bool is_single_level() const;

    /**
     * @brief Canonical JSON projection of the tree.
     *
     * `{"fragments": [{"begin", "children", "end", "id", "language", "lines"}, ...]}` with
     * sorted keys, one-space indentation and times as seconds with millisecond precision.
     * Identical trees yield byte-identical output.
     */
    std::string json_string() const;

    /// One line per top-level fragment.
    std::string to_string() const;

    /// Direct tree access for codecs that build nested structure.
    FragmentTree &fragments_tree() { return *tree_; }
    const FragmentTree &fragments_tree() const { return *tree_; }

    const RunConfiguration &run_configuration() const { return rconf_; }

    /**
     * @brief Read fragments from input_path in the given format and add them to this map.
     *
     * @param format Registry identifier, e.g. "srt". Empty, unknown or write-only formats fail
     *        with InvalidArgument before the file system is touched.
     * @param input_path Existing readable file; otherwise IoPermission.
     * @param parameters Passed to the codec. `language` overwrites every fragment's language
     *        after a successful parse.
     *
     * A codec that fails half-way leaves the fragments it already added.
     */
    SyncMapStatus read(const std::string &format, const std::string &input_path,
                       const SyncMapParameters &parameters = {});

    /**
     * @brief Write this map to output_path in the given format.
     *
     * Format, writability and codec parameters are all validated before any directory or file
     * is created. Missing parent directories are created.
     */
    SyncMapStatus write(const std::string &format, const std::string &output_path,
                        const SyncMapParameters &parameters = {}) const;

    /**
     * @brief Write a self-contained HTML page for fine tuning this map by hand.
     *
     * @param audio_file_path Audio referenced by the page (made absolute).
     * @param output_file_path Destination HTML file.
     * @param parameters `os_task_file_format` preselects the page's output format;
     *        `os_task_file_smil_audio_ref` / `os_task_file_smil_page_ref` apply to smil.
     */
    SyncMapStatus output_html_for_tuning(const std::string &audio_file_path,
                                         const std::string &output_file_path,
                                         const SyncMapParameters &parameters = {}) const;

   private:
    RunConfiguration rconf_;
    std::unique_ptr<FragmentTree> tree_;
};

/// @}

}  // namespace syncforge
