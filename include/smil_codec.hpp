//
//  smil_codec.hpp
//  SyncForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>

#include "sync_map_codec.hpp"

namespace syncforge {

/**
 * @brief SMIL 3.0 media overlay writer (EPUB 3 style).
 *
 * Requires `os_task_file_smil_audio_ref` and `os_task_file_smil_page_ref`; construction fails
 * with MissingParameter otherwise. Fragments with children become `<seq>`, leaves `<par>`.
 */
class SmilCodec : public SyncMapCodec {
   public:
    SmilCodec(SyncMapFormat variant, RunConfiguration rconf, std::string audio_ref,
              std::string page_ref);

    static CodecResult create(SyncMapFormat variant, const SyncMapParameters &parameters,
                              const RunConfiguration &rconf);

    SyncMapStatus format(const SyncMap &syncmap, std::string &out) const override;

   private:
    std::string audio_ref_;
    std::string page_ref_;
};

}  // namespace syncforge
