/**
 *  @file
 *  @copyright defined in eos/LICENSE.txt
 */
#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/singleton.hpp>
#include <credential.token/credential.token.hpp>
#include <credential.minter/eligibility.hpp>

#include <string>
#include <vector>

namespace credential {

   using eosio::name;
   using eosio::symbol;
   using std::vector;

   /**
    *  Self-service issuance of one credential per account.
    *
    *  An account holding at least `required_balance` of the configured asset may call `mint`
    *  exactly once and receives `mint_quantity` units of `token_id` from the token contract.
    *  The minter account must be an admin of that token contract.
    *
    *  `batchmint` is restricted to the owner and skips the balance check. Entries that have
    *  already minted are skipped without an error. Each entry is recorded and issued on its own;
    *  callers must not rely on the batch as a whole being applied or rejected as a unit.
    */
   class [[eosio::contract("credential.minter")]] minter : public eosio::contract {
      public:

         minter( name receiver, name code, eosio::datastream<const char*> ds )
         :contract(receiver, code, ds),
          _config(receiver, receiver.value),
          _stats(receiver, receiver.value)
         {}

         [[eosio::action]]
         void init( name owner, name token_contract, name asset_contract, symbol asset_symbol );

         [[eosio::action]]
         void mint( name account );

         [[eosio::action]]
         void batchmint( name caller, vector<name> accounts );

         [[eosio::action]]
         void updasset( name caller, name asset_contract, symbol asset_symbol );

         [[eosio::action]]
         void updbalance( name caller, uint64_t required_balance );

         [[eosio::action]]
         void updtokenid( name caller, uint64_t token_id );

         [[eosio::action]]
         void updquantity( name caller, uint64_t quantity );

         [[eosio::action]]
         void transferown( name caller, name new_owner );

         // read-only, results go to the console
         [[eosio::action]]
         void canmint( name account );

         [[eosio::action]]
         void balance( name account );

         // observations
         [[eosio::action]]
         void minted( name to, uint64_t token_id, uint64_t quantity );

         [[eosio::action]]
         void assetupdated( name old_contract, symbol old_symbol, name new_contract, symbol new_symbol );

         [[eosio::action]]
         void balupdated( uint64_t old_balance, uint64_t new_balance );

         [[eosio::action]]
         void tokenidupd( uint64_t old_token_id, uint64_t new_token_id );

         [[eosio::action]]
         void quantityupd( uint64_t old_quantity, uint64_t new_quantity );

         [[eosio::action]]
         void ownerchanged( name previous_owner, name new_owner );

         static bool has_minted( name minter_account, name account )
         {
            minted_accounts mintedtable( minter_account, minter_account.value );
            return mintedtable.find( account.value ) != mintedtable.end();
         }

         static bool can_mint( name minter_account, name account )
         {
            config_singleton cfgs( minter_account, minter_account.value );
            if( !cfgs.exists() || has_minted( minter_account, account ) )
               return false;

            const auto cfg = cfgs.get();
            return has_sufficient_balance( cfg.asset_contract, cfg.asset_symbol, cfg.required_balance, account );
         }

      private:
         struct [[eosio::table("config")]] minter_config {
            name     owner;
            name     token_contract;
            name     asset_contract;
            symbol   asset_symbol;
            uint64_t required_balance = 10100000; // 1010.0000 of a precision 4 asset
            uint64_t token_id = 0;
            uint64_t mint_quantity = 1;

            EOSLIB_SERIALIZE( minter_config, (owner)(token_contract)(asset_contract)(asset_symbol)
                                             (required_balance)(token_id)(mint_quantity) )
         };

         struct [[eosio::table("stats")]] minter_stats {
            uint64_t total_minted = 0;

            EOSLIB_SERIALIZE( minter_stats, (total_minted) )
         };

         // write-once, rows are never erased
         struct [[eosio::table("minted")]] minted_account {
            name     account;

            uint64_t primary_key()const { return account.value; }
         };

         typedef eosio::singleton< "config"_n, minter_config > config_singleton;
         typedef eosio::singleton< "stats"_n, minter_stats > stats_singleton;
         typedef eosio::multi_index< "minted"_n, minted_account > minted_accounts;

         config_singleton _config;
         stats_singleton  _stats;

         minter_config get_config();
         minter_config require_owner( name caller );
         void issue( const minter_config& cfg, name account );
   };

} /// namespace credential
