// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef MOESHARD_SRC_UTILS_TENSOR_H
#define MOESHARD_SRC_UTILS_TENSOR_H

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "dtype.h"
#include "utils.h"

constexpr int MAX_TENSOR_DIM = 5;

//! \brief The Tensor class represents a contiguous view on memory that is associated
//! with a specific data type and shape. It does not own its memory.
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

    //! Number of rows (size of the leading dimension); 0 for a rank-0 tensor.
    [[nodiscard]] long rows() const { return Rank > 0 ? Sizes[0] : 0; }

    //! Elements per row, i.e. the product of all trailing dimensions.
    [[nodiscard]] long row_size() const {
        long sz = 1;
        for(int i = 1; i < Rank; ++i) {
            sz *= Sizes[i];
        }
        return sz;
    }

    [[nodiscard]] bool is_null() const { return Data == nullptr; }
    [[nodiscard]] bool has_value() const { return Data != nullptr; }

    static Tensor empty(ETensorDType dtype, const std::vector<long>& shape) {
        if (shape.size() > MAX_TENSOR_DIM) throw std::runtime_error("Tensor rank too large");
        Tensor t;
        t.DType = dtype;
        t.Rank = (int)shape.size();
        for (int i = 0; i < t.Rank; ++i) t.Sizes[i] = shape[i];
        for (int i = t.Rank; i < MAX_TENSOR_DIM; ++i) t.Sizes[i] = 1;
        t.Data = nullptr;
        return t;
    }

    template<class TargetType>
    [[nodiscard]] constexpr const TargetType* get() const {
        if(dtype_from_type<TargetType> != DType) {
            throw std::logic_error(std::string("DType mismatch: expected ") +
                dtype_to_str(dtype_from_type<TargetType>) + ", got " + dtype_to_str(DType));
        }

        return reinterpret_cast<const TargetType*>(Data);
    }

    template<typename TargetType>
    [[nodiscard]] constexpr TargetType* get() {
        if(dtype_from_type<TargetType> != DType) {
            throw std::logic_error(std::string("DType mismatch: expected ") +
                dtype_to_str(dtype_from_type<TargetType>) + ", got " + dtype_to_str(DType));
        }

        return reinterpret_cast<TargetType*>(Data);
    }
};

void fill_zero(Tensor& dst);
Tensor slice(const Tensor& src, int dim, long start, long end);

//! \brief Host tensor that owns its allocation. Exposes the allocation through
//! the Tensor base, so it can be passed anywhere a Tensor view is expected.
//! Memory is zero-initialized.
class HostTensor : public Tensor {
public:
    HostTensor() = default;
    HostTensor(ETensorDType dtype, const std::vector<long>& shape);

    HostTensor(const HostTensor&) = delete;
    HostTensor& operator=(const HostTensor&) = delete;
    HostTensor(HostTensor&& other) noexcept;
    HostTensor& operator=(HostTensor&& other) noexcept;

    //! Deep copy of an arbitrary host tensor view.
    static HostTensor copy_of(const Tensor& src);

    template<typename T>
    static HostTensor from_vector(const std::vector<T>& values, const std::vector<long>& shape) {
        HostTensor t(dtype_from_type<T>, shape);
        if (t.nelem() != values.size()) {
            throw std::logic_error("HostTensor::from_vector: shape does not match number of values");
        }
        std::copy(values.begin(), values.end(), t.template get<T>());
        return t;
    }

    template<typename T>
    [[nodiscard]] std::vector<T> to_vector() const {
        const T* p = get<T>();
        return std::vector<T>(p, p + nelem());
    }

private:
    std::unique_ptr<std::byte[]> mStorage;
};

#endif //MOESHARD_SRC_UTILS_TENSOR_H
