#include <mock.asset/mock.asset.hpp>

namespace eosio
{

void mockasset::setbalance(name owner, asset balance)
{
   require_auth(get_self());
   check(balance.is_valid(), "invalid balance");
   check(balance.amount >= 0, "negative balance");

   accounts a_t(get_self(), owner.value);
   auto itr = a_t.find(balance.symbol.code().raw());
   if (itr == a_t.end())
   {
      a_t.emplace(get_self(), [&](auto &item) {
         item.balance = balance;
      });
   }
   else
   {
      a_t.modify(itr, same_payer, [&](auto &item) {
         item.balance = balance;
      });
   }
}

} // namespace eosio
