//
//  delimited_codec.hpp
//  SyncForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "sync_map_codec.hpp"

namespace syncforge {

/**
 * @brief One fragment per line, fields separated by a delimiter.
 *
 * Variants:
 *  - csv: `id,begin,end,"text"`
 *  - ssv: `begin end id "text"`
 *  - tsv: `begin<TAB>end<TAB>id`
 *  - txt: `id begin end "text"`
 *
 * Times are seconds with millisecond precision. Only top-level fragments are written.
 */
class DelimitedCodec : public SyncMapCodec {
   public:
    using SyncMapCodec::SyncMapCodec;

    static CodecResult create(SyncMapFormat variant, const SyncMapParameters &parameters,
                              const RunConfiguration &rconf);

    SyncMapStatus parse(const std::string &input_text, SyncMap &syncmap) override;
    SyncMapStatus format(const SyncMap &syncmap, std::string &out) const override;

   private:
    char delimiter() const;
};

}  // namespace syncforge
