/**
 *  @file
 *  @copyright defined in eos/LICENSE.txt
 */

#include <credential.token/credential.token.hpp>

#include <limits>

namespace credential {

   using eosio::check;
   using eosio::print;
   using eosio::same_payer;

   void token::init( name owner, string collection_name, string collection_symbol )
   {
      require_auth( get_self() );
      check( !_config.exists(), "contract is already initialized" );
      check( owner != name(), "invalid address" );
      check( is_account( owner ), "owner account does not exist" );
      check( collection_name.size() <= 256, "collection name has more than 256 bytes" );
      check( collection_symbol.size() <= 256, "collection symbol has more than 256 bytes" );

      token_config cfg;
      cfg.owner             = owner;
      cfg.collection_name   = collection_name;
      cfg.collection_symbol = collection_symbol;
      _config.set( cfg, get_self() );
   }

   void token::mint( name caller, name to, uint64_t id, uint64_t amount, vector<char> data )
   {
      require_authorized( caller );
      check( data.size() <= 256, "data has more than 256 bytes" );

      issue( to, id, amount );
   }

   void token::mintbatch( name caller, name to, vector<uint64_t> ids, vector<uint64_t> amounts, vector<char> data )
   {
      require_authorized( caller );
      check( ids.size() == amounts.size(), "ids and amounts length mismatch" );
      check( data.size() <= 256, "data has more than 256 bytes" );

      for( size_t i = 0; i < ids.size(); ++i ) {
         issue( to, ids[i], amounts[i] );
      }
   }

   void token::seturi( name caller, uint64_t id, string prefix )
   {
      require_authorized( caller );
      check( prefix.size() <= 256, "uri prefix has more than 256 bytes" );

      uris uritable( get_self(), get_self().value );
      auto existing = uritable.find( id );
      if( existing == uritable.end() ) {
         uritable.emplace( get_self(), [&]( auto& u ) {
            u.id     = id;
            u.prefix = prefix;
         });
      } else {
         uritable.modify( existing, same_payer, [&]( auto& u ) {
            u.prefix = prefix;
         });
      }

      SEND_INLINE_ACTION( *this, uriset, { {get_self(), "active"_n} }, { id, prefix } );
   }

   void token::uri( uint64_t id )
   {
      print( get_uri( get_self(), id ) );
   }

   void token::issue( name to, uint64_t id, uint64_t amount )
   {
      check( to != name(), "invalid address" );
      check( is_account( to ), "to account does not exist" );
      check( amount > 0, "quantity must be positive" );

      tokens tokentable( get_self(), get_self().value );
      auto existing = tokentable.find( id );
      if( existing == tokentable.end() ) {
         tokentable.emplace( get_self(), [&]( auto& t ) {
            t.id     = id;
            t.supply = amount;
         });
      } else {
         check( amount <= std::numeric_limits<uint64_t>::max() - existing->supply, "supply overflow" );
         tokentable.modify( existing, same_payer, [&]( auto& t ) {
            t.supply += amount;
         });
      }

      add_balance( to, id, amount );

      SEND_INLINE_ACTION( *this, tokenminted, { {get_self(), "active"_n} }, { to, id, amount } );
   }

   void token::add_balance( name owner, uint64_t id, uint64_t amount )
   {
      balances to_acnts( get_self(), owner.value );
      auto to = to_acnts.find( id );
      if( to == to_acnts.end() ) {
         to_acnts.emplace( get_self(), [&]( auto& b ){
            b.id     = id;
            b.amount = amount;
         });
      } else {
         to_acnts.modify( to, same_payer, [&]( auto& b ) {
            b.amount += amount;
         });
      }
   }

   void token::tokenminted( name to, uint64_t id, uint64_t amount )
   {
      require_auth( get_self() );
      require_recipient( to );
   }

   void token::uriset( uint64_t id, string prefix )
   {
      require_auth( get_self() );
   }

} /// namespace credential

EOSIO_DISPATCH( credential::token, (init)(addadmin)(rmvadmin)(transferown)(mint)(mintbatch)(seturi)(uri)(isauth)
                (adminadded)(adminremoved)(ownerchanged)(tokenminted)(uriset) )
