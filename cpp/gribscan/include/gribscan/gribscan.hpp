#pragma once

#include "cache.hpp"
#include "decoder.hpp"
#include "errors.hpp"
#include "field.hpp"
#include "reader.hpp"
#include "scanner.hpp"
#include "types.hpp"
