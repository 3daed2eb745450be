#include <credential.token/credential.token.hpp>

namespace credential {

   using eosio::check;
   using eosio::print;

   token::token_config token::get_config()
   {
      check( _config.exists(), "contract is not initialized" );
      return _config.get();
   }

   void token::require_owner( name caller )
   {
      require_auth( caller );
      check( get_config().owner == caller, "caller is not authorized" );
   }

   void token::require_authorized( name caller )
   {
      require_auth( caller );
      check( _config.exists(), "contract is not initialized" );
      check( is_authorized( get_self(), caller ), "caller is not authorized" );
   }

   void token::addadmin( name caller, name admin )
   {
      require_owner( caller );
      check( admin != name(), "invalid address" );

      admins admintable( get_self(), get_self().value );
      check( admintable.find( admin.value ) == admintable.end(), "account is already an admin" );

      auto cfg = get_config();
      check( admin != cfg.owner, "owner cannot be added as admin" );

      admintable.emplace( get_self(), [&]( auto& a ) {
         a.account = admin;
      });
      cfg.admin_count += 1;
      _config.set( cfg, get_self() );

      SEND_INLINE_ACTION( *this, adminadded, { {get_self(), "active"_n} }, { admin } );
   }

   void token::rmvadmin( name caller, name admin )
   {
      require_owner( caller );

      admins admintable( get_self(), get_self().value );
      auto itr = admintable.find( admin.value );
      check( itr != admintable.end(), "account is not an admin" );
      admintable.erase( itr );

      auto cfg = get_config();
      cfg.admin_count -= 1;
      _config.set( cfg, get_self() );

      SEND_INLINE_ACTION( *this, adminremoved, { {get_self(), "active"_n} }, { admin } );
   }

   void token::transferown( name caller, name new_owner )
   {
      require_owner( caller );
      check( new_owner != name(), "invalid address" );
      check( is_account( new_owner ), "owner account does not exist" );

      auto cfg = get_config();
      name previous_owner = cfg.owner;
      cfg.owner = new_owner;
      _config.set( cfg, get_self() );

      SEND_INLINE_ACTION( *this, ownerchanged, { {get_self(), "active"_n} }, { previous_owner, new_owner } );
   }

   void token::isauth( name account )
   {
      print( is_authorized( get_self(), account ) ? "true" : "false" );
   }

   void token::adminadded( name admin )
   {
      require_auth( get_self() );
   }

   void token::adminremoved( name admin )
   {
      require_auth( get_self() );
   }

   void token::ownerchanged( name previous_owner, name new_owner )
   {
      require_auth( get_self() );
   }

} /// namespace credential
