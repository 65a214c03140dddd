#pragma once

/**
 * codelang
 *
 * Guesses the programming language of a text snippet with a random
 * forest trained offline and compiled into the library.
 */

#include <codelang/classifier.hpp>
#include <codelang/config.hpp>
#include <codelang/model.hpp>
#include <codelang/model_loader.hpp>
#include <codelang/text_buffer.hpp>
