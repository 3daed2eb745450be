/**
 *  @file
 *  @copyright defined in eos/LICENSE.txt
 */
#pragma once

#include <eosio/eosio.hpp>
#include <eosio/singleton.hpp>

#include <string>
#include <vector>

namespace credential {

   using eosio::name;
   using std::string;
   using std::vector;

   /**
    *  Multi-token credential collection. One owner and a set of admins may issue
    *  any token id to any live account; every issued id is recorded as existing and
    *  may carry a metadata URI prefix.
    *
    *  Errors abort the transaction with the messages below so callers can branch on them:
    *  "caller is not authorized", "invalid address", "account is already an admin",
    *  "account is not an admin", "owner cannot be added as admin", "token does not exist",
    *  "ids and amounts length mismatch", "quantity must be positive".
    */
   class [[eosio::contract("credential.token")]] token : public eosio::contract {
      public:

         token( name receiver, name code, eosio::datastream<const char*> ds )
         :contract(receiver, code, ds),
          _config(receiver, receiver.value)
         {}

         [[eosio::action]]
         void init( name owner, string collection_name, string collection_symbol );

         [[eosio::action]]
         void addadmin( name caller, name admin );

         [[eosio::action]]
         void rmvadmin( name caller, name admin );

         /**
          *  Replaces the owner. The admin set is left untouched: the previous owner
          *  does not become an admin, and a new owner who is already an admin stays one.
          */
         [[eosio::action]]
         void transferown( name caller, name new_owner );

         [[eosio::action]]
         void mint( name caller, name to, uint64_t id, uint64_t amount, vector<char> data );

         [[eosio::action]]
         void mintbatch( name caller, name to, vector<uint64_t> ids, vector<uint64_t> amounts, vector<char> data );

         /**
          *  Stages a URI prefix for a token id. The id does not need to exist yet.
          */
         [[eosio::action]]
         void seturi( name caller, uint64_t id, string prefix );

         // read-only, result goes to the console
         [[eosio::action]]
         void uri( uint64_t id );

         [[eosio::action]]
         void isauth( name account );

         // observations, only the contract itself may send these
         [[eosio::action]]
         void adminadded( name admin );

         [[eosio::action]]
         void adminremoved( name admin );

         [[eosio::action]]
         void ownerchanged( name previous_owner, name new_owner );

         [[eosio::action]]
         void tokenminted( name to, uint64_t id, uint64_t amount );

         [[eosio::action]]
         void uriset( uint64_t id, string prefix );

         using mint_action = eosio::action_wrapper<"mint"_n, &token::mint>;

         static bool is_owner( name token_contract_account, name account )
         {
            config_singleton cfg( token_contract_account, token_contract_account.value );
            return cfg.exists() && cfg.get().owner == account;
         }

         static bool is_admin( name token_contract_account, name account )
         {
            admins admintable( token_contract_account, token_contract_account.value );
            return admintable.find( account.value ) != admintable.end();
         }

         static bool is_authorized( name token_contract_account, name account )
         {
            return is_owner( token_contract_account, account ) || is_admin( token_contract_account, account );
         }

         static bool exists( name token_contract_account, uint64_t id )
         {
            tokens tokentable( token_contract_account, token_contract_account.value );
            return tokentable.find( id ) != tokentable.end();
         }

         static string get_uri( name token_contract_account, uint64_t id )
         {
            eosio::check( exists( token_contract_account, id ), "token does not exist" );

            uris uritable( token_contract_account, token_contract_account.value );
            auto itr = uritable.find( id );
            string prefix = itr == uritable.end() ? string() : itr->prefix;
            return prefix + std::to_string( id ) + ".json";
         }

      private:
         struct [[eosio::table("config")]] token_config {
            name     owner;
            uint64_t admin_count = 0;
            string   collection_name;
            string   collection_symbol;

            EOSLIB_SERIALIZE( token_config, (owner)(admin_count)(collection_name)(collection_symbol) )
         };

         struct [[eosio::table]] admin {
            name     account;

            uint64_t primary_key()const { return account.value; }
         };

         // one row per id ever issued
         struct [[eosio::table]] token_stats {
            uint64_t id;
            uint64_t supply = 0;

            uint64_t primary_key()const { return id; }
         };

         struct [[eosio::table]] token_uri {
            uint64_t id;
            string   prefix;

            uint64_t primary_key()const { return id; }
         };

         // scoped by holder
         struct [[eosio::table]] balance {
            uint64_t id;
            uint64_t amount = 0;

            uint64_t primary_key()const { return id; }
         };

         typedef eosio::singleton< "config"_n, token_config > config_singleton;
         typedef eosio::multi_index< "admins"_n, admin > admins;
         typedef eosio::multi_index< "tokens"_n, token_stats > tokens;
         typedef eosio::multi_index< "uris"_n, token_uri > uris;
         typedef eosio::multi_index< "balances"_n, balance > balances;

         config_singleton _config;

         token_config get_config();
         void require_owner( name caller );
         void require_authorized( name caller );
         void issue( name to, uint64_t id, uint64_t amount );
         void add_balance( name owner, uint64_t id, uint64_t amount );
   };

} /// namespace credential
