//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2016 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#define RECON_LOG_LEVEL_QUIET 0
#define RECON_LOG_LEVEL_CRITICAL 1
#define RECON_LOG_LEVEL_ERROR 2
#define RECON_LOG_LEVEL_WARNING 3
#define RECON_LOG_LEVEL_INFO 4
#define RECON_LOG_LEVEL_VERBOSE 5
#define RECON_LOG_LEVEL_DEBUG 6
#define RECON_LOG_LEVEL_TRACE 7

// The build system passes the maximum compiled-in log level; everything above
// it compiles to nothing.
#ifndef RECON_LOG_LEVEL
#  define RECON_LOG_LEVEL RECON_LOG_LEVEL_DEBUG
#endif

#ifndef RECON_VERSION
#  define RECON_VERSION "0.1.0"
#endif
