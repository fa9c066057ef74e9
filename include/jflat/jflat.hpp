#pragma once

// jflat: a small, header-only C++17 library that flattens nested JSON into a
// single-level, insertion-ordered key/value map and renders it back to JSON.

#include <jflat/decimal.hpp>
#include <jflat/error.hpp>
#include <jflat/escape.hpp>
#include <jflat/flatten.hpp>
#include <jflat/flattener.hpp>
#include <jflat/key_encoder.hpp>
#include <jflat/options.hpp>
#include <jflat/output.hpp>
#include <jflat/parser.hpp>
#include <jflat/render.hpp>
#include <jflat/value.hpp>
