#pragma once
#ifndef CANON_CBOR_CBOR_FWD_HPP
#define CANON_CBOR_CBOR_FWD_HPP
/* This file is part of Canon CBOR project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

namespace canon_cbor::cbor {
    struct encoder;
    struct value;
    struct decode_options;
    struct decode_error;
}

#endif // !CANON_CBOR_CBOR_FWD_HPP
