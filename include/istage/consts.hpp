#pragma once
#include <cstddef>
#include <string_view>

namespace istage::consts {

inline constexpr std::string_view kProgramName = "git-istage";
inline constexpr std::string_view kGitExe      = "git";

// ——— `git status --porcelain` line layout ———
// "XY PATH": two status chars, one separator, then the path.
inline constexpr std::size_t kStatusPathOffset = 3;
inline constexpr std::size_t kMinStatusLine    = 4;
inline constexpr std::string_view kRenameArrow = " -> ";

// ——— Status characters ———
inline constexpr char kUntracked = '?';
inline constexpr char kAdded     = 'A';
inline constexpr char kRenamed   = 'R';
inline constexpr char kCopied    = 'C';
inline constexpr char kSpace     = ' ';

// ——— Working tree check ———
inline constexpr std::string_view kTrue = "true";

// ——— Glyphs ———
inline constexpr std::string_view kCursorMark    = "> ";
inline constexpr std::string_view kNoCursorMark  = "  ";
inline constexpr std::string_view kGlyphStaged   = "[✓]";
inline constexpr std::string_view kGlyphPartial  = "[~]";
inline constexpr std::string_view kGlyphUnstaged = "[ ]";
inline constexpr std::string_view kAsciiStaged   = "[x]";

// ——— Key hints ———
inline constexpr std::string_view kArrowsUnicode = "↑/↓";
inline constexpr std::string_view kArrowsAscii   = "up/down";

inline constexpr std::string_view kNoDifferences = "(no differences)";
inline constexpr std::string_view kNoChanges     = "No changes to stage or unstage.";

// ——— Process exit codes ———
inline constexpr int kExecFailed = 127;
inline constexpr int kSignalBase = 128;

} // namespace istage::consts
