// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "tensor.h"

#include <cstring>

/**
 * @brief Create a view onto rows [start, end) of @p src.
 *
 * Only the leading dimension can be sliced, so the result stays contiguous.
 * Empty slices (start == end) are allowed, including at the end of the tensor.
 *
 * @param src   Tensor to slice.
 * @param dim   Dimension to slice; must be 0.
 * @param start First row of the slice.
 * @param end   One past the last row of the slice.
 * @return Non-owning view sharing memory with @p src.
 *
 * @throws std::logic_error If @p dim is not 0 or the range is out of bounds.
 */
Tensor slice(const Tensor& src, int dim, long start, long end) {
    if (dim != 0)
        throw std::logic_error("Slices must be contiguous, so only the first dimension can be sliced.");

    if (start < 0 || start > end || end > src.Sizes[dim])
        throw std::logic_error("Slice out of bounds.");

    Tensor dst = src;
    dst.Sizes[dim] = end - start;
    std::ptrdiff_t offset = start * src.row_size() * get_dtype_size(src.DType);
    dst.Data = src.Data == nullptr ? nullptr : src.Data + offset;
    return dst;
}

/**
 * @brief Fill a host tensor's buffer with zeros.
 */
void fill_zero(Tensor& dst) {
    if (dst.Data && dst.bytes() > 0) {
        std::memset(dst.Data, 0, dst.bytes());
    }
}

HostTensor::HostTensor(ETensorDType dtype, const std::vector<long>& shape) :
    Tensor(Tensor::empty(dtype, shape))
{
    for (long s : shape) {
        if (s < 0) throw std::logic_error("HostTensor: negative dimension");
    }
    // always allocate at least one byte so Data is non-null for empty tensors
    mStorage = std::make_unique<std::byte[]>(std::max<std::size_t>(bytes(), 1));
    Data = mStorage.get();
}

HostTensor::HostTensor(HostTensor&& other) noexcept :
    Tensor(other), mStorage(std::move(other.mStorage))
{
    static_cast<Tensor&>(other) = Tensor{};
}

HostTensor& HostTensor::operator=(HostTensor&& other) noexcept {
    if (this == &other) return *this;
    static_cast<Tensor&>(*this) = static_cast<const Tensor&>(other);
    mStorage = std::move(other.mStorage);
    static_cast<Tensor&>(other) = Tensor{};
    return *this;
}

HostTensor HostTensor::copy_of(const Tensor& src) {
    std::vector<long> shape(src.Sizes.begin(), src.Sizes.begin() + src.Rank);
    HostTensor t(src.DType, shape);
    if (src.bytes() > 0) {
        std::memcpy(t.Data, src.Data, src.bytes());
    }
    return t;
}
