/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __CELLTRACK_HPP
#define __CELLTRACK_HPP

#include <celltrack/config.hpp>
#include <celltrack/codec.hpp>
#include <celltrack/payload.hpp>
#include <celltrack/packets.hpp>
#include <celltrack/client.hpp>

#endif
