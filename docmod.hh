// docmod: documentation option composer and artifact scrubber
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 The docmod authors
#pragma once

#include "errors.hh"
#include "config_tree.hh"
#include "logging.hh"
#include "scrub.hh"
#include "compose.hh"
#include "schema.hh"
#include "documentation.hh"
#include "assembly.hh"
#include "yaml_io.hh"
#include "settings.hh"
