#pragma once

// Umbrella header for identpick
#include "error.h"
#include "unicode_util.h"
#include "char_class.h"
#include "keywords.h"
#include "ident_set.h"
#include "sanitize.h"
#include "resolver.h"
#include "letter_sequence.h"
#include "picker.h"
