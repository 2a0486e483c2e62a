#pragma once

#include <eosio/asset.hpp>
#include <eosio/crypto.hpp>
#include <eosio/singleton.hpp>
#include <eosio/system.hpp>
#include <eosio/time.hpp>

#include <string>

namespace rdn {

using namespace eosio;
using namespace std;

static constexpr name     active_perm           = "active"_n;
static constexpr name     SYS_BANK              = "eosio.token"_n;
static constexpr symbol   SYS_SYMBOL            = symbol(symbol_code("SYS"), 4);

static constexpr uint32_t MAX_NAME_SIZE         = 64;
static constexpr uint32_t MAX_DESCRIPTION_SIZE  = 1024;
static constexpr uint32_t MAX_MESSAGE_SIZE      = 256;

#define CONTRACT_TBL [[eosio::table, eosio::contract("real.donate")]]

struct [[eosio::table("global"), eosio::contract("real.donate")]] global_t {
    name        bank                = SYS_BANK;
    symbol      donate_symbol       = SYS_SYMBOL;
    uint64_t    active_projects     = 0;
    asset       total_donated       = asset(0, SYS_SYMBOL);    //always grow
    asset       total_deposited     = asset(0, SYS_SYMBOL);    //not yet donated nor withdrawn

    EOSLIB_SERIALIZE( global_t, (bank)(donate_symbol)(active_projects)(total_donated)(total_deposited) )
};
typedef eosio::singleton< "global"_n, global_t > global_singleton;

struct CONTRACT_TBL project_t {
    uint64_t        pk = 0;             //PK
    checksum256     id;                 //sha256(creator, proj_name, created_at)

    name            creator;
    string          proj_name;          //1..64 bytes
    time_point_sec  created_at;

    uint64_t primary_key()const { return pk; }
    uint64_t scope()const { return 0; }

    checksum256 by_id()const { return id; }

    project_t() {}
    project_t(const name& code) {
        tbl_t tbl(code, code.value);
        pk = tbl.available_primary_key();
    }

    typedef eosio::multi_index
        < "projects"_n, project_t,
            indexed_by<"byid"_n, const_mem_fun<project_t, checksum256, &project_t::by_id> >
        > tbl_t;

    EOSLIB_SERIALIZE( project_t, (pk)(id)(creator)(proj_name)(created_at) )
};

/**
 * returned by getproject, zero-valued when the project is absent
 */
struct project_info {
    checksum256     id;
    name            creator;
    string          proj_name;
    time_point_sec  created_at;

    EOSLIB_SERIALIZE( project_info, (id)(creator)(proj_name)(created_at) )
};

//scope: donor
struct CONTRACT_TBL donation_t {
    uint64_t        pk = 0;             //PK

    name            donor;
    checksum256     project_id;
    asset           donated;            //cumulative, never decreases
    time_point_sec  updated_at;

    uint64_t primary_key()const { return pk; }
    uint64_t scope()const { return donor.value; }

    checksum256 by_project()const { return project_id; }

    donation_t() {}
    donation_t(const name& d): donor(d) {}
    donation_t(const name& code, const name& d): donor(d) {
        tbl_t tbl(code, d.value);
        pk = tbl.available_primary_key();
    }

    typedef eosio::multi_index
        < "donated"_n, donation_t,
            indexed_by<"byproject"_n, const_mem_fun<donation_t, checksum256, &donation_t::by_project> >
        > tbl_t;

    EOSLIB_SERIALIZE( donation_t, (pk)(donor)(project_id)(donated)(updated_at) )
};

struct CONTRACT_TBL deposit_t {
    name            owner;              //PK
    asset           balance;

    uint64_t primary_key()const { return owner.value; }
    uint64_t scope()const { return 0; }

    deposit_t() {}
    deposit_t(const name& o): owner(o) {}

    typedef eosio::multi_index<"deposits"_n, deposit_t> tbl_t;

    EOSLIB_SERIALIZE( deposit_t, (owner)(balance) )
};

} //rdn namespace
