#pragma once
#ifndef CANON_CBOR_CODEC_FWD_HPP
#define CANON_CBOR_CODEC_FWD_HPP
/* This file is part of Canon CBOR project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <canon/cbor/fwd.hpp>

namespace canon_cbor::codec {
    template<typename T>
    cbor::value to_value(const T &val);

    template<typename T>
    void decode_into(T &out, const cbor::value &v, const cbor::decode_options &opts);
}

#endif // !CANON_CBOR_CODEC_FWD_HPP
