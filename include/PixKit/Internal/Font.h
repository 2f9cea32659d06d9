#pragma once

/**
 * @file Font.h
 * @brief Built-in 5x7 bitmap font for annotation labels
 *
 * Covers A-Z, 0-9, space and basic punctuation. Lowercase letters map to
 * uppercase, anything else renders as '?'.
 */

#include <cstdint>
#include <string>

namespace Pix::Kit::Internal {

constexpr int32_t GLYPH_WIDTH = 5;
constexpr int32_t GLYPH_HEIGHT = 7;
constexpr int32_t GLYPH_ADVANCE = GLYPH_WIDTH + 1;

/**
 * @brief Row bitmaps of a glyph
 * @return GLYPH_HEIGHT rows; bit (GLYPH_WIDTH - 1) is the leftmost column
 */
const uint8_t* GlyphRows(char c);

/// Whether the font has a dedicated glyph for c (after case folding)
bool HasGlyph(char c);

/// Pixel width of text at the given scale (no trailing spacing)
int32_t TextWidth(const std::string& text, int32_t scale = 1);

} // namespace Pix::Kit::Internal
