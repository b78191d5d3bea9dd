#pragma once

#include <fc/exception/exception.hpp>

namespace fortune { namespace engine {

FC_DECLARE_EXCEPTION(         wheel_exception,                                                            40000, "Wheel Exception" );

FC_DECLARE_DERIVED_EXCEPTION( authorization_error,            fortune::engine::wheel_exception,         41000, "authorization error" );
FC_DECLARE_DERIVED_EXCEPTION( not_organizer,                  fortune::engine::authorization_error,     41001, "caller is not the organizer" );
FC_DECLARE_DERIVED_EXCEPTION( not_a_winner,                   fortune::engine::authorization_error,     41002, "caller is not a recorded winner" );

FC_DECLARE_DERIVED_EXCEPTION( state_error,                    fortune::engine::wheel_exception,         42000, "state error" );
FC_DECLARE_DERIVED_EXCEPTION( wheel_cancelled,                fortune::engine::state_error,             42001, "wheel is cancelled" );
FC_DECLARE_DERIVED_EXCEPTION( wheel_exhausted,                fortune::engine::state_error,             42002, "all prizes have been drawn" );
FC_DECLARE_DERIVED_EXCEPTION( draws_started,                  fortune::engine::state_error,             42003, "wheel has already been spun" );
FC_DECLARE_DERIVED_EXCEPTION( wheel_not_exhausted,            fortune::engine::state_error,             42004, "prizes remain to be drawn" );
FC_DECLARE_DERIVED_EXCEPTION( auto_assign_unavailable,        fortune::engine::state_error,             42005, "last prize cannot be auto assigned" );
FC_DECLARE_DERIVED_EXCEPTION( outdated_version,               fortune::engine::state_error,             42006, "engine version is not current" );

FC_DECLARE_DERIVED_EXCEPTION( validation_error,               fortune::engine::wheel_exception,         43000, "validation error" );
FC_DECLARE_DERIVED_EXCEPTION( invalid_entry_count,            fortune::engine::validation_error,        43001, "invalid entry count" );
FC_DECLARE_DERIVED_EXCEPTION( insufficient_unique_entries,    fortune::engine::validation_error,        43002, "fewer unique entries than prizes" );
FC_DECLARE_DERIVED_EXCEPTION( invalid_prize_count,            fortune::engine::validation_error,        43003, "invalid prize count" );
FC_DECLARE_DERIVED_EXCEPTION( invalid_prize_amount,           fortune::engine::validation_error,        43004, "invalid prize amount" );
FC_DECLARE_DERIVED_EXCEPTION( invalid_permutation,            fortune::engine::validation_error,        43005, "invalid permutation" );
FC_DECLARE_DERIVED_EXCEPTION( invalid_amount,                 fortune::engine::validation_error,        43006, "invalid amount" );
FC_DECLARE_DERIVED_EXCEPTION( asset_type_mismatch,            fortune::engine::validation_error,        43007, "asset type mismatch" );
FC_DECLARE_DERIVED_EXCEPTION( invalid_timing,                 fortune::engine::validation_error,        43008, "invalid timing parameter" );
FC_DECLARE_DERIVED_EXCEPTION( addition_overflow,              fortune::engine::validation_error,        43009, "addition overflow" );
FC_DECLARE_DERIVED_EXCEPTION( subtraction_overflow,           fortune::engine::validation_error,        43010, "subtraction overflow" );

FC_DECLARE_DERIVED_EXCEPTION( timing_error,                   fortune::engine::wheel_exception,         44000, "timing error" );
FC_DECLARE_DERIVED_EXCEPTION( claim_too_early,                fortune::engine::timing_error,            44001, "claim delay has not elapsed" );
FC_DECLARE_DERIVED_EXCEPTION( claim_window_passed,            fortune::engine::timing_error,            44002, "claim window has passed" );
FC_DECLARE_DERIVED_EXCEPTION( reclaim_too_early,              fortune::engine::timing_error,            44003, "claim windows are still open" );

FC_DECLARE_DERIVED_EXCEPTION( funds_error,                    fortune::engine::wheel_exception,         45000, "funds error" );
FC_DECLARE_DERIVED_EXCEPTION( insufficient_funds,             fortune::engine::funds_error,             45001, "insufficient funds" );

FC_DECLARE_DERIVED_EXCEPTION( not_found_error,                fortune::engine::wheel_exception,         46000, "not found" );
FC_DECLARE_DERIVED_EXCEPTION( no_unclaimed_prize,             fortune::engine::not_found_error,         46001, "no unclaimed prize" );
FC_DECLARE_DERIVED_EXCEPTION( no_entries_remaining,           fortune::engine::not_found_error,         46002, "no entries remaining" );
FC_DECLARE_DERIVED_EXCEPTION( nothing_to_reclaim,             fortune::engine::not_found_error,         46003, "nothing to reclaim" );
FC_DECLARE_DERIVED_EXCEPTION( unknown_wheel,                  fortune::engine::not_found_error,         46004, "unknown wheel" );

} } // fortune::engine
