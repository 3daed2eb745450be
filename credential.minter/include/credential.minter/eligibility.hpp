#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>

namespace credential {

    using eosio::asset;
    using eosio::name;
    using eosio::symbol;

    // row layout of the eosio.token "accounts" table, scoped by holder
    struct asset_account
    {
        asset balance;

        uint64_t primary_key() const { return balance.symbol.code().raw(); }
    };

    typedef eosio::multi_index<"accounts"_n, asset_account> asset_accounts;

    inline uint64_t balance_of(name asset_contract, name owner, const symbol& sym)
    {
        asset_accounts accounts_table(asset_contract, owner.value);
        auto itr = accounts_table.find(sym.code().raw());

        if (itr == accounts_table.end() || itr->balance.amount < 0) return 0;
        return static_cast<uint64_t>(itr->balance.amount);
    }

    // equal balance qualifies
    inline bool has_sufficient_balance(name asset_contract, const symbol& sym, uint64_t required_balance, name owner)
    {
        return balance_of(asset_contract, owner, sym) >= required_balance;
    }

} // namespace credential
