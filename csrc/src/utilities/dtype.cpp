// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "dtype.h"

namespace lowbit {

const char* dtype_to_str(ETensorDType dtype) {
    switch (dtype) {
        case ETensorDType::FP32: return "fp32";
        case ETensorDType::BF16: return "bf16";
        case ETensorDType::FP16: return "fp16";
        case ETensorDType::BYTE: return "byte";
    }
    return "unknown";
}

} // namespace lowbit
