// Public header for the jsonex library
#pragma once

#include <jx/value.h>
#include <jx/parse_error.h>
#include <jx/utf8.h>
#include <jx/json.h>
