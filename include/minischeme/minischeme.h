#pragma once

// Umbrella header for minischeme
#include "value.h"
#include "error.h"
#include "native_function.h"
#include "lexical.h"
#include "word_splitter.h"
#include "ast.h"
#include "parser.h"
#include "environment.h"
#include "builtins.h"
#include "evaluator.h"
#include "interpreter.h"
