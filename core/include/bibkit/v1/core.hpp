#pragma once

// =============================================================================
// BibKit v1 - BibTeX ingestion and normalization
// =============================================================================
// Main header for the v1 API:
// - Tokenizer and FieldExtractor for raw .bib text
// - KeySanitizer and ContentNormalizer (fixed LaTeX escape table)
// - Validator, Assembler and the BibEngine facade
// - JSON conversions and paper sinks
// =============================================================================

#include "bibkit/v1/diagnostics.hpp"
#include "bibkit/v1/entry.hpp"
#include "bibkit/v1/paper.hpp"
#include "bibkit/v1/tokenizer.hpp"
#include "bibkit/v1/key_sanitizer.hpp"
#include "bibkit/v1/field_extractor.hpp"
#include "bibkit/v1/escape_table.hpp"
#include "bibkit/v1/normalizer.hpp"
#include "bibkit/v1/validator.hpp"
#include "bibkit/v1/assembler.hpp"
#include "bibkit/v1/engine.hpp"
#include "bibkit/v1/sink.hpp"
