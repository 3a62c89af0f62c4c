// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "cuda_utils.h"

#include <cuda_runtime.h>
#include <fmt/core.h>

/**
 * @brief Throws a cuda_error if a CUDA runtime call failed.
 *
 * Clears the current CUDA error state via cudaGetLastError() before throwing,
 * so calls to the CUDA API in the exception handler do not see the old error.
 *
 * @param status The CUDA runtime status returned by the evaluated statement.
 * @param statement The stringified CUDA statement/expression that produced @p status.
 * @param file Source file where the error occurred.
 * @param line Source line where the error occurred.
 *
 * @throws cuda_error If @p status != cudaSuccess.
 */
void cuda_throw_on_error(cudaError_t status, const char* statement, const char* file, int line) {
    if (status != cudaSuccess) {
        std::string msg = fmt::format("Cuda Error in {}:{} ({}): {}: {}", file, line, statement,
                                      cudaGetErrorName(status), cudaGetErrorString(status));
        [[maybe_unused]] cudaError_t clear_error = cudaGetLastError();
        throw cuda_error(status, msg);
    }
}
