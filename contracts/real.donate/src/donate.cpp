#include <eosio.token/eosio.token.hpp>
#include "real.donate/donate.hpp"
#include "real.donate/utils.hpp"

namespace rdn {

using namespace std;
using namespace eosio;

/*************** Begin of Helper functions ***************************************/

void real_donate::_check_string(const string& str, const uint32_t& min_size, const uint32_t& max_size) {
    CHECK( str.size() >= min_size && str.size() <= max_size, "IncorrectStringFormat: " + str )
}

void real_donate::_check_amount(const asset& quantity) {
    CHECK( quantity.amount > 0, "InsufficientFunds: " + quantity.to_string() )
}

void real_donate::_check_creator(const project_t& proj, const name& caller) {
    CHECK( proj.creator == caller, "IllegalCaller: " + caller.to_string() )
}

void real_donate::_check_not_creator(const project_t& proj, const name& caller) {
    CHECK( proj.creator != caller, "IllegalCaller: " + caller.to_string() )
}

void real_donate::_check_exists(const project_t& proj, const checksum256& project_id) {
    CHECK( proj.creator.value != 0, "ProjectExisted: " + to_hex(project_id) )
}

checksum256 real_donate::_derive_id(const name& creator, const string& proj_name, const time_point_sec& created_at) {
    auto packed = pack( std::make_tuple(creator, proj_name, created_at) );
    return sha256( packed.data(), packed.size() );
}

project_t real_donate::_get_project(const checksum256& project_id) {
    project_t proj;
    if (!_dbc.get_by<"byid"_n>( proj, project_id ))
        return project_t();

    return proj;
}

/*************** Begin of ACTION functions ***************************************/

ACTION real_donate::init(const name& bank, const symbol& donate_symbol) {
    require_auth( _self );

    CHECK( is_account(bank), "bank not an account: " + bank.to_string() )
    CHECK( donate_symbol.is_valid(), "symbol not valid: " + donate_symbol.code().to_string() )

    auto unchanged = bank == _gstate.bank && donate_symbol == _gstate.donate_symbol;
    CHECK( unchanged || (_gstate.total_donated.amount == 0 && _gstate.total_deposited.amount == 0),
           "bank and symbol locked after first deposit or donation" )

    _gstate.bank                = bank;
    _gstate.donate_symbol       = donate_symbol;
    _gstate.total_donated       = asset(_gstate.total_donated.amount, donate_symbol);
    _gstate.total_deposited     = asset(_gstate.total_deposited.amount, donate_symbol);

}

ACTION real_donate::create(const name& creator, const string& proj_name, const string& description) {
    require_auth( creator );

    _check_string( proj_name, 1, MAX_NAME_SIZE );
    _check_string( description, 0, MAX_DESCRIPTION_SIZE );

    auto created_at = time_point_sec( current_time_point() );
    auto project_id = _derive_id( creator, proj_name, created_at );

    //same creator, name and block time yield the same id: last write wins
    auto proj = _get_project( project_id );
    if (proj.creator.value == 0)
        proj = project_t( _self );

    proj.id             = project_id;
    proj.creator        = creator;
    proj.proj_name      = proj_name;
    proj.created_at     = created_at;
    if (_dbc.set( proj ) == return_t::APPENDED)
        _gstate.active_projects++;

    createlog_action createlog_act{ _self, { {_self, active_perm} } };
    createlog_act.send( project_id, creator, proj_name, description, created_at );

}

ACTION real_donate::moddesc(const name& caller, const checksum256& project_id, const string& description) {
    require_auth( caller );

    auto proj = _get_project( project_id );
    _check_creator( proj, caller );
    _check_string( description, 0, MAX_DESCRIPTION_SIZE );

    moddesclog_action moddesclog_act{ _self, { {_self, active_perm} } };
    moddesclog_act.send( project_id, description, time_point_sec( current_time_point() ) );

}

ACTION real_donate::cease(const name& caller, const checksum256& project_id) {
    require_auth( caller );

    auto proj = _get_project( project_id );
    _check_creator( proj, caller );

    _dbc.del( proj );
    _gstate.active_projects--;

    ceaselog_action ceaselog_act{ _self, { {_self, active_perm} } };
    ceaselog_act.send( project_id, time_point_sec( current_time_point() ) );

}

project_info real_donate::getproject(const checksum256& project_id) {
    auto proj = _get_project( project_id );

    return project_info{ proj.id, proj.creator, proj.proj_name, proj.created_at };
}

asset real_donate::getdonated(const name& donor, const checksum256& project_id) {
    donation_t donation(donor);
    if (!_dbc.get_by<"byproject"_n>( donation, project_id ))
        return asset(0, _gstate.donate_symbol);

    return donation.donated;
}

/*************** Begin of log actions ********************************************/

ACTION real_donate::createlog(const checksum256& project_id, const name& creator, const string& proj_name,
                              const string& description, const time_point_sec& created_at) {
    require_auth( _self );
    require_recipient( creator );
}

ACTION real_donate::moddesclog(const checksum256& project_id, const string& description, const time_point_sec& updated_at) {
    require_auth( _self );
}

ACTION real_donate::ceaselog(const checksum256& project_id, const time_point_sec& ceased_at) {
    require_auth( _self );
}

ACTION real_donate::donatelog(const checksum256& project_id, const name& donor, const name& receiver, const string& proj_name,
                              const asset& quantity, const string& message, const time_point_sec& donated_at) {
    require_auth( _self );
    require_recipient( donor );
    require_recipient( receiver );
}

} //rdn namespace
