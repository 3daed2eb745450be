/**
 *  @file
 *  @copyright defined in eos/LICENSE.txt
 */

#include <credential.minter/credential.minter.hpp>

#include <limits>

namespace credential {

   using eosio::check;
   using eosio::print;

   void minter::init( name owner, name token_contract, name asset_contract, symbol asset_symbol )
   {
      require_auth( get_self() );
      check( !_config.exists(), "contract is already initialized" );
      check( owner != name(), "invalid address" );
      check( is_account( owner ), "owner account does not exist" );
      check( token_contract != name(), "invalid address" );
      check( asset_contract != name(), "invalid address" );
      check( asset_symbol.is_valid(), "invalid symbol" );

      minter_config cfg;
      cfg.owner          = owner;
      cfg.token_contract = token_contract;
      cfg.asset_contract = asset_contract;
      cfg.asset_symbol   = asset_symbol;
      _config.set( cfg, get_self() );
      _stats.set( minter_stats{}, get_self() );
   }

   void minter::mint( name account )
   {
      require_auth( account );
      const auto cfg = get_config();

      check( !has_minted( get_self(), account ), "account has already minted" );
      check( has_sufficient_balance( cfg.asset_contract, cfg.asset_symbol, cfg.required_balance, account ),
             "insufficient balance to mint" );

      issue( cfg, account );
   }

   void minter::batchmint( name caller, vector<name> accounts )
   {
      const auto cfg = require_owner( caller );

      for( const auto& account : accounts ) {
         if( has_minted( get_self(), account ) ) {
            print( "skipping ", account, ": already minted\n" );
            continue;
         }
         issue( cfg, account );
      }
   }

   /**
    *  Records the account, bumps the running total and asks the token contract to issue.
    *  Callers have already ruled out a second mint for the account.
    */
   void minter::issue( const minter_config& cfg, name account )
   {
      check( account != name(), "invalid address" );

      minted_accounts mintedtable( get_self(), get_self().value );
      mintedtable.emplace( get_self(), [&]( auto& m ) {
         m.account = account;
      });

      auto st = _stats.get_or_default();
      check( cfg.mint_quantity <= std::numeric_limits<uint64_t>::max() - st.total_minted, "total minted overflow" );
      st.total_minted += cfg.mint_quantity;
      _stats.set( st, get_self() );

      token::mint_action mint_act{ cfg.token_contract, { get_self(), "active"_n } };
      mint_act.send( get_self(), account, cfg.token_id, cfg.mint_quantity, vector<char>() );

      SEND_INLINE_ACTION( *this, minted, { {get_self(), "active"_n} }, { account, cfg.token_id, cfg.mint_quantity } );

      print( "minted ", cfg.mint_quantity, " of token ", cfg.token_id, " to ", account, "\n" );
   }

   void minter::canmint( name account )
   {
      print( can_mint( get_self(), account ) ? "true" : "false" );
   }

   void minter::balance( name account )
   {
      const auto cfg = get_config();
      print( balance_of( cfg.asset_contract, account, cfg.asset_symbol ) );
   }

   void minter::minted( name to, uint64_t token_id, uint64_t quantity )
   {
      require_auth( get_self() );
      require_recipient( to );
   }

} /// namespace credential

EOSIO_DISPATCH( credential::minter, (init)(mint)(batchmint)(updasset)(updbalance)(updtokenid)(updquantity)
                (transferown)(canmint)(balance)
                (minted)(assetupdated)(balupdated)(tokenidupd)(quantityupd)(ownerchanged) )
