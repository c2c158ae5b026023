#pragma once

// Fixed layout policy shared by the editor and the print pipeline.
namespace PlatenConstants {

// Document layout
constexpr int DocumentWidth = 65;       // Wrap width in characters
constexpr int LinesPerPage = 54;        // Text lines per printed page (US Letter)
constexpr int PageContextLines = 2;     // Overlap kept when paging up/down

// Physical page (US Letter, 6 lines per inch)
constexpr double LetterWidthInches = 8.5;
constexpr double LetterHeightInches = 11.0;
constexpr double PointsPerInch = 72.0;
constexpr int LinesPerInch = 6;
constexpr double LineHeightPoints = PointsPerInch / LinesPerInch;   // 12 pt

// Margins
constexpr double StandardMarginInches = 1.0;    // 10-pitch fonts
constexpr double NarrowMarginInches = 1.25;     // 12-pitch fonts
constexpr double VerticalMarginInches = 1.0;
constexpr double BindingOffsetInches = 0.25;    // Double-sided gutter shift
constexpr int PageNumberLine = 3;               // 0-based line in the top margin

// Undo
constexpr int UndoLimit = 500;

} // namespace PlatenConstants
