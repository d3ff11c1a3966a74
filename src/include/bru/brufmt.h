// Public header for the brufmt library
#pragma once

#include <bru/blocks.h>
#include <bru/decode.h>
#include <bru/encode.h>
#include <bru/error.h>
#include <bru/json.h>
