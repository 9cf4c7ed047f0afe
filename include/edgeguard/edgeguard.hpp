// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of EdgeGuard, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <edgeguard/auth/unverified_claims.hpp>
#include <edgeguard/common/errors.hpp>
#include <edgeguard/core/config_loader.hpp>
#include <edgeguard/core/json.hpp>
#include <edgeguard/core/logger.hpp>
#include <edgeguard/crypto/secure_rng.hpp>
#include <edgeguard/edge_config.hpp>
#include <edgeguard/network/client_ip_resolver.hpp>
#include <edgeguard/network/forwarded.hpp>
#include <edgeguard/network/ip_utils.hpp>
#include <edgeguard/network/request_view.hpp>
#include <edgeguard/network/trusted_proxies.hpp>
#include <edgeguard/parsers/http_message.hpp>
#include <edgeguard/system/hostname.hpp>
#include <edgeguard/util/base64.hpp>
#include <edgeguard/util/strings.hpp>
