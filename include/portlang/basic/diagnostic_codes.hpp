// portlang/basic/diagnostic_codes.hpp - Stable diagnostic codes
//
// Codes are part of the tool's external contract: tests and tooling match on
// them, so existing values must never be renumbered.
//
#pragma once

#include <string_view>

namespace portlang::diag_code
{

// Lexical
inline constexpr std::string_view k_string_line_break = "LEX001";
inline constexpr std::string_view k_unterminated_string = "LEX002";
inline constexpr std::string_view k_multiple_decimal_points = "LEX003";
inline constexpr std::string_view k_invalid_number = "LEX004";
inline constexpr std::string_view k_unrecognized_character = "LEX005";

// Syntactic
inline constexpr std::string_view k_unexpected_token = "SYN001";
inline constexpr std::string_view k_fractional_horizon = "SYN002";
inline constexpr std::string_view k_internal_parser_error = "SYN999";

// Semantic
inline constexpr std::string_view k_missing_document = "SEM001";
inline constexpr std::string_view k_empty_allocation = "SEM002";
inline constexpr std::string_view k_allocation_exceeds = "SEM003";
inline constexpr std::string_view k_allocation_short = "SEM004";
inline constexpr std::string_view k_percentage_out_of_range = "SEM005";
inline constexpr std::string_view k_missing_risk_profile = "SEM007";
inline constexpr std::string_view k_conservative_exposure = "SEM008";
inline constexpr std::string_view k_moderate_exposure = "SEM009";
inline constexpr std::string_view k_aggressive_exposure = "SEM011";
inline constexpr std::string_view k_volatility_out_of_range = "SEM013";
inline constexpr std::string_view k_management_fee_out_of_range = "SEM018";

// Report generation
inline constexpr std::string_view k_renderer_unavailable = "GEN001";
inline constexpr std::string_view k_report_generated = "GEN002";
inline constexpr std::string_view k_report_failed = "GEN003";

}  // namespace portlang::diag_code
