#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>

namespace eosio {

   /**
    *  Balance source for tests. Rows follow the eosio.token "accounts" layout so
    *  consumers read it exactly as they would read a real token contract.
    */
   class [[eosio::contract("mock.asset")]] mockasset : public contract {
      public:
         using contract::contract;

         [[eosio::action]]
         void setbalance( name owner, asset balance );

      private:

         struct [[eosio::table]] account
         {
            asset balance;

            uint64_t primary_key() const { return balance.symbol.code().raw(); }
         };
         typedef eosio::multi_index<"accounts"_n, account> accounts;

   };
   
} /// namespace eosio
