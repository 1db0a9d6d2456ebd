#pragma once

#include "type.hpp"
#include "errors.hpp"
#include "annotated.hpp"
#include "options.hpp"
#include "parser_concept.hpp"
#include "value_parser.hpp"
#include "parser_utils.hpp"
#include "error_formatting.hpp"
