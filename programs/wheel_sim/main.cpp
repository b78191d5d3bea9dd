#include <fortune/engine/claim_window.hpp>
#include <fortune/engine/exceptions.hpp>
#include <fortune/engine/wheel_engine.hpp>

#include <fc/crypto/elliptic.hpp>
#include <fc/exception/exception.hpp>
#include <fc/filesystem.hpp>
#include <fc/io/json.hpp>
#include <fc/log/file_appender.hpp>
#include <fc/log/logger.hpp>
#include <fc/log/logger_config.hpp>
#include <fc/reflect/variant.hpp>
#include <fc/string.hpp>

#include <boost/program_options.hpp>

#include <algorithm>
#include <iostream>
#include <map>
#include <set>

using namespace fortune::engine;

struct config
{
   config():log_level("info"),seed("fortune"){}
   std::string                  log_level;
   std::string                  log_file;
   std::string                  seed;
};

/**
 *  One raffle, described by participant names.  Names are turned into
 *  addresses by regenerating a private key from sha256( name ).
 */
struct scenario
{
   scenario():donation(0),delay_ms(0),claim_window_ms(0),start_time_ms(0),spin_interval_ms(0),ordered(false){}

   std::string                  organizer = "organizer";
   std::vector<std::string>     entries;
   std::vector<share_type>      prizes;
   share_type                   donation;          ///< 0 funds exactly the prize total
   uint64_t                     delay_ms;
   uint64_t                     claim_window_ms;
   uint64_t                     start_time_ms;
   uint64_t                     spin_interval_ms;
   bool                         ordered;
   std::vector<std::string>     skip_claim;        ///< winners that never claim
};

FC_REFLECT( config, (log_level)(log_file)(seed) )
FC_REFLECT( scenario, (organizer)(entries)(prizes)(donation)(delay_ms)(claim_window_ms)
                      (start_time_ms)(spin_interval_ms)(ordered)(skip_claim) )

void     configure_logging( const config& cfg );
fc::path get_data_dir( const boost::program_options::variables_map& option_variables );
config   load_config( const fc::path& datadir );
fc::variant run_scenario( const scenario& sc, const fc::sha256& seed );

address name_to_address( const std::string& name )
{
   return address( fc::ecc::private_key::regenerate( fc::sha256::hash( name ) ).get_public_key() );
}

int main( int argc, char** argv )
{
   boost::program_options::options_description option_config("Allowed options");
   option_config.add_options()("data-dir", boost::program_options::value<std::string>(), "configuration data directory")
                              ("help", "display this help message")
                              ("scenario", boost::program_options::value<std::string>(), "JSON file describing the raffle to run")
                              ("seed", boost::program_options::value<std::string>(), "seed for the random oracle")
                              ("log-level", boost::program_options::value<std::string>(), "debug, info, warn or error")
                              ("ordered", "draw through a shuffled permutation instead of plain random draws");

   boost::program_options::positional_options_description positional_config;
   positional_config.add("data-dir", 1);

   boost::program_options::variables_map option_variables;
   try
   {
      boost::program_options::store( boost::program_options::command_line_parser( argc, argv )
                                        .options( option_config ).positional( positional_config ).run(),
                                     option_variables );
      boost::program_options::notify( option_variables );
   }
   catch( const boost::program_options::error& e )
   {
      std::cerr << "Error parsing command-line options: " << e.what() << "\n\n";
      std::cerr << option_config << "\n";
      return 1;
   }

   if( option_variables.count("help") || !option_variables.count("scenario") )
   {
      std::cout << option_config << "\n";
      return option_variables.count("help") ? 0 : 1;
   }

   try {
      fc::path datadir = get_data_dir(option_variables);
      config cfg = load_config(datadir);
      if (option_variables.count("seed"))
         cfg.seed = option_variables["seed"].as<std::string>();
      if (option_variables.count("log-level"))
         cfg.log_level = option_variables["log-level"].as<std::string>();
      configure_logging(cfg);

      fc::path scenario_file( option_variables["scenario"].as<std::string>() );
      scenario sc = fc::json::from_file( scenario_file ).as<scenario>();
      if (option_variables.count("ordered"))
         sc.ordered = true;

      auto result = run_scenario( sc, fc::sha256::hash( cfg.seed ) );
      std::cout << fc::json::to_pretty_string( result ) << "\n";
   }
   catch ( const fc::exception& e )
   {
      elog( "${e}", ("e", e.to_detail_string() ) );
      std::cerr << e.to_string() << "\n";
      return 1;
   }
   return 0;
}

/** a permutation of [0, n) shuffled with values from the oracle */
std::vector<uint32_t> shuffled_positions( uint32_t n, random_oracle& shuffler )
{
   std::vector<uint32_t> positions( n );
   for( uint32_t i = 0; i < n; ++i )
      positions[i] = i;
   for( uint32_t i = n; i > 1; --i )
      std::swap( positions[i-1], positions[ shuffler.next_index( i ) ] );
   return positions;
}

fc::variant run_scenario( const scenario& sc, const fc::sha256& seed )
{ try {
   auto db  = std::make_shared<wheel_database>();
   auto log = std::make_shared<memory_event_log>();
   wheel_engine engine( db, log );

   simulated_clock clock( time_point_from_ms( sc.start_time_ms ) );
   sha256_random_oracle oracle( seed );
   sha256_random_oracle shuffler( fc::sha256::hash( seed ) );

   const address organizer = name_to_address( sc.organizer );
   std::map<address, std::string> names;
   names[organizer] = sc.organizer;

   std::vector<address> entries;
   for( const auto& name : sc.entries )
   {
      entries.push_back( name_to_address( name ) );
      names[entries.back()] = name;
   }

   const wheel_id_type id = engine.create_wheel( organizer, entries, sc.prizes, sc.delay_ms, sc.claim_window_ms );

   share_type donation = sc.donation;
   if( donation == 0 )
      donation = engine.get_wheel( id ).ledger.total_prizes();
   engine.donate( id, organizer, asset( donation ) );

   while( !engine.get_wheel( id ).is_exhausted() )
   {
      const wheel_record rec = engine.get_wheel( id );
      if( sc.ordered )
      {
         const auto permutation = shuffled_positions( uint32_t( rec.entries.size() ), shuffler );
         engine.draw_with_order_and_auto_assign( id, organizer, permutation, oracle, clock );
      }
      else
      {
         engine.draw_and_auto_assign( id, organizer, oracle, clock );
      }
      clock.advance_ms( int64_t( sc.spin_interval_ms ) );
   }

   wheel_record rec = engine.get_wheel( id );
   std::set<std::string> skipped( sc.skip_claim.begin(), sc.skip_claim.end() );

   fc::mutable_variant_object claims;
   for( uint32_t i = 0; i < rec.winners.size(); ++i )
   {
      const auto& w = rec.winners[i];
      const std::string& name = names[w.winner];
      if( skipped.count( name ) || w.claimed )
         continue;

      const fc::time_point opens_at = claim_window_policy::claim_opens_at( rec.spin_times[i], rec.delay_ms );
      if( clock.now() < opens_at )
         clock.set_time( opens_at );

      try
      {
         const asset payout = engine.claim( id, w.winner, clock );
         claims( name + "#" + fc::to_string( int64_t(i) ), payout );
      }
      catch( const timing_error& e )
      {
         wlog( "${n} missed prize ${i}: ${e}", ("n",name)("i",i)("e",e.to_string()) );
      }
      rec = engine.get_wheel( id );
   }

   clock.set_time( std::max( clock.now(),
                             claim_window_policy::claim_closes_at( rec.max_spin_time(), rec.delay_ms, rec.claim_window_ms ) ) );

   fc::optional<asset> reclaimed;
   if( engine.get_wheel( id ).pool_value().amount > 0 )
      reclaimed = engine.reclaim( id, organizer, clock );

   fc::mutable_variant_object result;
   result( "wheel", engine.get_wheel( id ).to_variant() );
   result( "claims", claims );
   result( "reclaimed", reclaimed );
   result( "events", log->to_variant() );
   return fc::variant( result );
} FC_CAPTURE_AND_RETHROW( (sc) ) }

void configure_logging( const config& cfg )
{
   fc::logging_config log_cfg;

   log_cfg.appenders.push_back(
            fc::appender_config( "stderr", "console",
                                 fc::mutable_variant_object()
                                 ( "stream","std_error")
                                 ) );

   fc::logger_config dlc;
   dlc.level = fc::variant( cfg.log_level ).as<fc::log_level>();
   dlc.name = "default";
   dlc.appenders.push_back("stderr");

   if( !cfg.log_file.empty() )
   {
      fc::file_appender::config ac;
      ac.filename = cfg.log_file;
      ac.truncate = false;
      ac.flush    = true;
      log_cfg.appenders.push_back(fc::appender_config( "default", "file", fc::variant(ac)));
      dlc.appenders.push_back("default");
   }

   log_cfg.loggers.push_back(dlc);
   fc::configure_logging( log_cfg );
}

fc::path get_data_dir( const boost::program_options::variables_map& option_variables )
{ try {
   if( option_variables.count("data-dir") )
      return fc::path( option_variables["data-dir"].as<std::string>() );
#if defined( WIN32 ) || defined( __APPLE__ )
   return fc::app_path() / "FortuneWheel";
#else
   return fc::app_path() / ".fortune_wheel";
#endif
} FC_RETHROW_EXCEPTIONS( warn, "unable to determine data directory" ) }

config load_config( const fc::path& datadir )
{ try {
   const fc::path config_file = datadir / "config.json";
   config cfg;
   if( fc::exists( config_file ) )
   {
      cfg = fc::json::from_file( config_file ).as<config>();
   }
   else
   {
      ilog( "creating default config file ${f}", ("f",config_file) );
      fc::create_directories( datadir );
      fc::json::save_to_file( cfg, config_file );
   }
   return cfg;
} FC_RETHROW_EXCEPTIONS( warn, "unable to load config file ${cfg}", ("cfg",datadir/"config.json") ) }
