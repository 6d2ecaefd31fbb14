// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOWBIT_SRC_UTILS_TENSOR_H
#define LOWBIT_SRC_UTILS_TENSOR_H

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include "dtype.h"
#include "utils.h"

namespace lowbit {

constexpr int MAX_TENSOR_DIM = 5;

//! \brief The Tensor class represents a contiguous, non-owning view on host memory that is
//! associated with a specific data type and shape.
struct Tensor {
    ETensorDType DType = ETensorDType::FP32;
    std::array<long, MAX_TENSOR_DIM> Sizes{};
    std::byte* Data = nullptr;
    int Rank = 0;

    [[nodiscard]] constexpr std::size_t bytes() const {
        return nelem() * get_dtype_size(DType);
    }

    [[nodiscard]] constexpr std::size_t nelem() const {
        std::size_t sz = 1;
        for(int i = 0; i < Rank; ++i) {
            sz *= Sizes[i];
        }
        return sz;
    }

    template<class TargetType>
    [[nodiscard]] constexpr const TargetType* get() const {
        if(dtype_from_type<TargetType> != DType) {
            throw ShapeMismatchError(std::string("DType mismatch: expected ") +
                dtype_to_str(dtype_from_type<TargetType>) + ", got " + dtype_to_str(DType));
        }

        return reinterpret_cast<const TargetType*>(Data);
    }

    template<typename TargetType>
    [[nodiscard]] constexpr TargetType* get() {
        if(dtype_from_type<TargetType> != DType) {
            throw ShapeMismatchError(std::string("DType mismatch: expected ") +
                dtype_to_str(dtype_from_type<TargetType>) + ", got " + dtype_to_str(DType));
        }

        return reinterpret_cast<TargetType*>(Data);
    }

    template<typename Container>
    static Tensor from_pointer(std::byte* ptr, ETensorDType dtype, const Container& shape)
    {
        if(shape.size() > MAX_TENSOR_DIM) {
            throw std::runtime_error("Tensor rank too large");
        }

        int rank = narrow<int>(shape.size());
        std::array<long, MAX_TENSOR_DIM> sizes{};
        std::copy(shape.begin(), shape.end(), sizes.begin());
        std::fill(sizes.begin() + shape.size(), sizes.end(), 1);

        return Tensor{dtype, sizes, ptr, rank};
    }

    //! One-dimensional view of a typed host buffer. The view does not extend the buffer's lifetime.
    template<typename T>
    static Tensor from_span(std::span<T> data) {
        using Element = std::remove_const_t<T>;
        auto* ptr = reinterpret_cast<std::byte*>(const_cast<Element*>(data.data()));
        return from_pointer(ptr, dtype_from_type<Element>, std::array<long, 1>{static_cast<long>(data.size())});
    }

    template<typename T>
    static Tensor from_vector(std::vector<T>& data) {
        return from_span(std::span<T>(data));
    }

    template<typename T>
    static Tensor from_vector(const std::vector<T>& data) {
        return from_span(std::span<const T>(data));
    }
};

} // namespace lowbit

#endif //LOWBIT_SRC_UTILS_TENSOR_H
