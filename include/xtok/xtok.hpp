// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Xtok, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "core/config_loader.hpp"
#include "core/json.hpp"
#include "core/logger.hpp"
#include "encoding/decoder.hpp"
#include "encoding/encoding.hpp"
#include "io/byte_source.hpp"
#include "parsers/event.hpp"
#include "parsers/minimal_toml.hpp"
#include "parsers/reader.hpp"

#define XTOK_VERSION_MAJOR 0
#define XTOK_VERSION_MINOR 1
#define XTOK_VERSION_PATCH 0
