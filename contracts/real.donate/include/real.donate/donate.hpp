#pragma once

#include <eosio/eosio.hpp>
#include <eosio/asset.hpp>
#include <eosio/system.hpp>
#include <eosio/crypto.hpp>
#include <eosio/action.hpp>
#include <string>
#include <vector>

#include "wasm_db.hpp"
#include "entities.hpp"

using namespace wasm::db;

namespace rdn {

using eosio::asset;
using eosio::check;
using eosio::checksum256;
using eosio::datastream;
using eosio::name;
using eosio::symbol;
using eosio::time_point_sec;

using std::string;

static constexpr bool DEBUG = true;

class [[eosio::contract("real.donate")]] real_donate: public eosio::contract {
  private:
    global_singleton    _global;
    global_t            _gstate;
    std::vector<char>   _gstate_loaded;     //packed state as loaded, to skip saving when unchanged
    dbc                 _dbc;

  public:
    using contract::contract;

    real_donate(eosio::name receiver, eosio::name code, datastream<const char*> ds):
        contract(receiver, code, ds), _global(get_self(), get_self().value), _dbc(get_self())
    {
      _gstate = _global.exists() ? _global.get() : global_t{};
      _gstate_loaded = eosio::pack( _gstate );
    }

    ~real_donate() {
      if (eosio::pack( _gstate ) != _gstate_loaded)
        _global.set( _gstate, get_self() );
    }

    [[eosio::action]]
    void init(const name& bank, const symbol& donate_symbol);  //only code maintainer can init

    [[eosio::action]]
    void create(const name& creator, const string& proj_name, const string& description);

    [[eosio::action]]
    void moddesc(const name& caller, const checksum256& project_id, const string& description);

    [[eosio::action]]
    void cease(const name& caller, const checksum256& project_id);

    /**
     * donate from the donor's deposit
     */
    [[eosio::action]]
    void donate(const name& donor, const checksum256& project_id, const asset& quantity, const string& message);

    [[eosio::action]]
    void withdraw(const name& owner, const asset& quantity);

    /**
     * memo "donate:<project_id>[:<message>]" donates the transferred quantity,
     * memo "deposit" credits the sender's deposit, any other memo is rejected
     */
    [[eosio::on_notify("*::transfer")]]
    void ontransfer(const name& from, const name& to, const asset& quantity, const string& memo);

    [[eosio::action]]
    project_info getproject(const checksum256& project_id);

    [[eosio::action]]
    asset getdonated(const name& donor, const checksum256& project_id);

    ///event logs, sent inline by the contract only
    [[eosio::action]]
    void createlog(const checksum256& project_id, const name& creator, const string& proj_name,
                   const string& description, const time_point_sec& created_at);

    [[eosio::action]]
    void moddesclog(const checksum256& project_id, const string& description, const time_point_sec& updated_at);

    [[eosio::action]]
    void ceaselog(const checksum256& project_id, const time_point_sec& ceased_at);

    [[eosio::action]]
    void donatelog(const checksum256& project_id, const name& donor, const name& receiver, const string& proj_name,
                   const asset& quantity, const string& message, const time_point_sec& donated_at);

    using init_action       = action_wrapper<name("init"),       &real_donate::init       >;
    using create_action     = action_wrapper<name("create"),     &real_donate::create     >;
    using moddesc_action    = action_wrapper<name("moddesc"),    &real_donate::moddesc    >;
    using cease_action      = action_wrapper<name("cease"),      &real_donate::cease      >;
    using donate_action     = action_wrapper<name("donate"),     &real_donate::donate     >;
    using withdraw_action   = action_wrapper<name("withdraw"),   &real_donate::withdraw   >;

    using createlog_action  = action_wrapper<name("createlog"),  &real_donate::createlog  >;
    using moddesclog_action = action_wrapper<name("moddesclog"), &real_donate::moddesclog >;
    using ceaselog_action   = action_wrapper<name("ceaselog"),   &real_donate::ceaselog   >;
    using donatelog_action  = action_wrapper<name("donatelog"),  &real_donate::donatelog  >;

  private:
    void _check_string(const string& str, const uint32_t& min_size, const uint32_t& max_size);
    void _check_amount(const asset& quantity);
    void _check_creator(const project_t& proj, const name& caller);
    void _check_not_creator(const project_t& proj, const name& caller);
    void _check_exists(const project_t& proj, const checksum256& project_id);

    checksum256 _derive_id(const name& creator, const string& proj_name, const time_point_sec& created_at);
    project_t _get_project(const checksum256& project_id);

    void _donate(const name& donor, const checksum256& project_id, const asset& quantity,
                 const string& message, const bool& from_deposit);
    void _add_donated(const name& donor, const checksum256& project_id, const asset& quantity);
    void _add_deposit(const name& owner, const asset& quantity);
    void _sub_deposit(const name& owner, const asset& quantity);

};

} //rdn namespace
