#pragma once

#include <fortune/engine/config.hpp>
#include <fortune/engine/events.hpp>
#include <fortune/engine/random_oracle.hpp>
#include <fortune/engine/spin_engine.hpp>
#include <fortune/engine/time.hpp>
#include <fortune/engine/wheel_database.hpp>

namespace fortune { namespace engine {

class wheel_evaluation_state;

/**
 *  Supplied by whoever administers upgrades.  Every public operation
 *  refuses to run unless version matches FORTUNE_ENGINE_VERSION.
 */
struct version_gate
{
    version_gate():version(FORTUNE_ENGINE_VERSION){}
    explicit version_gate( uint32_t v ):version(v){}

    uint32_t version;
};

/**
 *  The draw / claim state machine.
 *
 *  A wheel moves created -> active -> exhausted as prizes are drawn, or
 *  created -> cancelled.  Organizer-only operations configure, fund, draw,
 *  reclaim and cancel; a recorded winner claims.
 *
 *  Each call loads the wheel, checks every guard, mutates a working copy
 *  and commits it with its events in one step.  Any failure throws a
 *  fortune::engine::wheel_exception and leaves the stored wheel untouched.
 *
 *  Calls against one wheel must be serialized by the host; the engine holds
 *  no locks.
 */
class wheel_engine
{
    public:
        wheel_engine( const wheel_database_ptr& db,
                      const event_log_ptr& log,
                      const version_gate& gate = version_gate() );
        ~wheel_engine();

        wheel_id_type      create_wheel( const address& organizer,
                                         const vector<address>& entries,
                                         const vector<share_type>& prize_amounts,
                                         uint64_t delay_ms,
                                         uint64_t claim_window_ms,
                                         asset_id_type pool_asset_id = FORTUNE_DEFAULT_ASSET_ID );

        void               donate( wheel_id_type id, const address& caller, const asset& amount );

        void               update_entries( wheel_id_type id, const address& caller, const vector<address>& entries );
        void               update_prizes( wheel_id_type id, const address& caller, const vector<share_type>& prize_amounts );
        void               update_delay( wheel_id_type id, const address& caller, uint64_t delay_ms );
        void               update_claim_window( wheel_id_type id, const address& caller, uint64_t claim_window_ms );

        /** draws one winner and removes every entry of that winner */
        address            draw( wheel_id_type id, const address& caller,
                                 random_oracle& oracle, const clock_interface& clock );

        /** draws one winner through the permutation and removes only the drawn entry */
        address            draw_with_order( wheel_id_type id, const address& caller,
                                            const vector<uint32_t>& permutation,
                                            random_oracle& oracle, const clock_interface& clock );

        /** assigns the last prize to the only address left, without randomness */
        address            auto_assign_last( wheel_id_type id, const address& caller, const clock_interface& clock );

        /**
         *  draw() followed, in the same commit, by auto_assign_last() when the
         *  draw leaves one prize and one address.  @return the winners in order
         */
        vector<address>    draw_and_auto_assign( wheel_id_type id, const address& caller,
                                                 random_oracle& oracle, const clock_interface& clock );
        vector<address>    draw_with_order_and_auto_assign( wheel_id_type id, const address& caller,
                                                            const vector<uint32_t>& permutation,
                                                            random_oracle& oracle, const clock_interface& clock );

        /** pays the caller's earliest claimable prize */
        asset              claim( wheel_id_type id, const address& caller, const clock_interface& clock );

        /** returns everything left in the pool once all prizes are drawn and every window closed */
        asset              reclaim( wheel_id_type id, const address& caller, const clock_interface& clock );

        /** cancels an unspun wheel, returning the pool if it holds anything */
        optional<asset>    cancel_and_reclaim( wheel_id_type id, const address& caller );

        wheel_record       get_wheel( wheel_id_type id )const;

        void               set_version_gate( const version_gate& gate ) { _gate = gate; }

    private:
        void               check_version()const;
        void               check_organizer( const wheel_record& rec, const address& caller )const;
        void               check_not_cancelled( const wheel_record& rec )const;
        void               check_configurable( const wheel_record& rec )const;
        void               check_drawable( const wheel_record& rec )const;

        void               record_draw( wheel_evaluation_state& state, const spin_result& result,
                                        const fc::time_point now )const;
        bool               can_auto_assign( const wheel_record& rec )const;
        address            assign_last( wheel_evaluation_state& state, const fc::time_point now )const;

        wheel_database_ptr _db;
        event_log_ptr      _log;
        version_gate       _gate;
};

} } // fortune::engine

FC_REFLECT( fortune::engine::version_gate, (version) )
