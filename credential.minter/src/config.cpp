#include <credential.minter/credential.minter.hpp>

namespace credential {

   using eosio::check;

   minter::minter_config minter::get_config()
   {
      check( _config.exists(), "contract is not initialized" );
      return _config.get();
   }

   minter::minter_config minter::require_owner( name caller )
   {
      require_auth( caller );
      auto cfg = get_config();
      check( caller == cfg.owner, "caller is not authorized" );
      return cfg;
   }

   void minter::updasset( name caller, name asset_contract, symbol asset_symbol )
   {
      auto cfg = require_owner( caller );
      check( asset_contract != name(), "invalid address" );
      check( asset_symbol.is_valid(), "invalid symbol" );

      name   old_contract = cfg.asset_contract;
      symbol old_symbol   = cfg.asset_symbol;
      cfg.asset_contract = asset_contract;
      cfg.asset_symbol   = asset_symbol;
      _config.set( cfg, get_self() );

      SEND_INLINE_ACTION( *this, assetupdated, { {get_self(), "active"_n} },
                          { old_contract, old_symbol, asset_contract, asset_symbol } );
   }

   void minter::updbalance( name caller, uint64_t required_balance )
   {
      auto cfg = require_owner( caller );

      uint64_t old_balance = cfg.required_balance;
      cfg.required_balance = required_balance;
      _config.set( cfg, get_self() );

      SEND_INLINE_ACTION( *this, balupdated, { {get_self(), "active"_n} }, { old_balance, required_balance } );
   }

   void minter::updtokenid( name caller, uint64_t token_id )
   {
      auto cfg = require_owner( caller );

      uint64_t old_token_id = cfg.token_id;
      cfg.token_id = token_id;
      _config.set( cfg, get_self() );

      SEND_INLINE_ACTION( *this, tokenidupd, { {get_self(), "active"_n} }, { old_token_id, token_id } );
   }

   void minter::updquantity( name caller, uint64_t quantity )
   {
      auto cfg = require_owner( caller );
      check( quantity > 0, "quantity must be positive" );

      uint64_t old_quantity = cfg.mint_quantity;
      cfg.mint_quantity = quantity;
      _config.set( cfg, get_self() );

      SEND_INLINE_ACTION( *this, quantityupd, { {get_self(), "active"_n} }, { old_quantity, quantity } );
   }

   void minter::transferown( name caller, name new_owner )
   {
      auto cfg = require_owner( caller );
      check( new_owner != name(), "invalid address" );
      check( is_account( new_owner ), "owner account does not exist" );

      name previous_owner = cfg.owner;
      cfg.owner = new_owner;
      _config.set( cfg, get_self() );

      SEND_INLINE_ACTION( *this, ownerchanged, { {get_self(), "active"_n} }, { previous_owner, new_owner } );
   }

   void minter::assetupdated( name old_contract, symbol old_symbol, name new_contract, symbol new_symbol )
   {
      require_auth( get_self() );
   }

   void minter::balupdated( uint64_t old_balance, uint64_t new_balance )
   {
      require_auth( get_self() );
   }

   void minter::tokenidupd( uint64_t old_token_id, uint64_t new_token_id )
   {
      require_auth( get_self() );
   }

   void minter::quantityupd( uint64_t old_quantity, uint64_t new_quantity )
   {
      require_auth( get_self() );
   }

   void minter::ownerchanged( name previous_owner, name new_owner )
   {
      require_auth( get_self() );
   }

} /// namespace credential
