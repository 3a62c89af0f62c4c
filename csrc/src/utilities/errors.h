// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef MOESHARD_SRC_UTILITIES_ERRORS_H
#define MOESHARD_SRC_UTILITIES_ERRORS_H

#include <stdexcept>
#include <string>

/// Thrown when a layer is configured inconsistently (indivisible expert counts,
/// expert shapes that do not fit the activation, invalid options). Raised at
/// construction or load time, before any forward pass runs.
class configuration_error : public std::runtime_error {
public:
    explicit configuration_error(const std::string& msg) : std::runtime_error(msg) {}
};

/// Thrown when the token exchange between expert-parallel ranks is inconsistent:
/// count or split mismatches, a routing map built against another ownership table,
/// expert output rows that do not match the map. Never recovered inside the layer.
class dispatch_protocol_error : public std::runtime_error {
public:
    explicit dispatch_protocol_error(const std::string& msg) : std::runtime_error(msg) {}
};

#endif //MOESHARD_SRC_UTILITIES_ERRORS_H
