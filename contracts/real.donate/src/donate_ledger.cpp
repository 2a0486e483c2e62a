#include <eosio.token/eosio.token.hpp>
#include "real.donate/donate.hpp"
#include "real.donate/utils.hpp"

namespace rdn {

using namespace std;
using namespace eosio;

static constexpr string_view DONATE_MEMO  = "donate:";
static constexpr string_view DEPOSIT_MEMO = "deposit";

/**
 *  validate, forward the full quantity to the current creator, then credit the ledger
 */
void real_donate::_donate(const name& donor, const checksum256& project_id, const asset& quantity,
                          const string& message, const bool& from_deposit) {
    _check_amount( quantity );
    CHECK( quantity.symbol == _gstate.donate_symbol, "symbol not allowed: " + quantity.symbol.code().to_string() )
    _check_string( message, 0, MAX_MESSAGE_SIZE );

    auto proj = _get_project( project_id );
    _check_exists( proj, project_id );
    _check_not_creator( proj, donor );

    auto receiver = proj.creator;
    CHECK( receiver != _self && is_account(receiver), "TransactionFailed" )

    if (from_deposit)
        _sub_deposit( donor, quantity );

    TRANSFER( _gstate.bank, receiver, quantity, message )

    _add_donated( donor, project_id, quantity );
    _gstate.total_donated += quantity;

    RDN_LOG( DEBUG, donor, " -> ", receiver, ": ", quantity, "\n" )

    donatelog_action donatelog_act{ _self, { {_self, active_perm} } };
    donatelog_act.send( project_id, donor, receiver, proj.proj_name, quantity, message,
                        time_point_sec( current_time_point() ) );
}

void real_donate::_add_donated(const name& donor, const checksum256& project_id, const asset& quantity) {
    donation_t donation(donor);
    if (!_dbc.get_by<"byproject"_n>( donation, project_id )) {
        donation            = donation_t( _self, donor );
        donation.project_id = project_id;
        donation.donated    = asset(0, quantity.symbol);
    }

    donation.donated        += quantity;
    donation.updated_at     = time_point_sec( current_time_point() );
    _dbc.set( donation );
}

void real_donate::_add_deposit(const name& owner, const asset& quantity) {
    deposit_t deposit(owner);
    if (!_dbc.get( deposit ))
        deposit.balance = asset(0, quantity.symbol);

    deposit.balance += quantity;
    _dbc.set( deposit );

    _gstate.total_deposited += quantity;
}

void real_donate::_sub_deposit(const name& owner, const asset& quantity) {
    deposit_t deposit(owner);
    CHECK( _dbc.get( deposit ) && deposit.balance.symbol == quantity.symbol && deposit.balance.amount >= quantity.amount,
           "InsufficientFunds: " + quantity.to_string() )

    deposit.balance -= quantity;
    if (deposit.balance.amount == 0)
        _dbc.del( deposit );
    else
        _dbc.set( deposit );

    _gstate.total_deposited -= quantity;
}

/**
 * 	triggered by transfer event of the bank contract
 *
 *  @from: 		donor or depositor
 *  @to: 		this contract
 *  @quantity:	amount attached
 *  @memo: 		"donate:<project_id>[:<message>]" or "deposit"
 */
void real_donate::ontransfer(const name& from, const name& to, const asset& quantity, const string& memo) {
    if (from == _self || to != _self) return;

    require_auth( from );
    CHECK( get_first_receiver() == _gstate.bank, "bank not allowed: " + get_first_receiver().to_string() )
    CHECK( quantity.symbol == _gstate.donate_symbol, "symbol not allowed: " + quantity.symbol.code().to_string() )
    _check_amount( quantity );

    string_view memosv(memo);
    if (memosv == DEPOSIT_MEMO) {
        _add_deposit( from, quantity );
        return;
    }

    CHECK( starts_with(memosv, DONATE_MEMO), "memo must be of donate:<project_id>[:<message>] or deposit" )

    auto details    = memosv.substr( DONATE_MEMO.size() );
    auto sep        = details.find( ':' );
    auto message    = (sep == string_view::npos) ? string() : string( details.substr(sep + 1) );

    checksum256 project_id;
    CHECK( hex_to_checksum256( details.substr(0, sep), project_id ), "memo must be of donate:<project_id>[:<message>] or deposit" )

    _donate( from, project_id, quantity, message, false );
}

ACTION real_donate::donate(const name& donor, const checksum256& project_id, const asset& quantity, const string& message) {
    require_auth( donor );

    _donate( donor, project_id, quantity, message, true );
}

ACTION real_donate::withdraw(const name& owner, const asset& quantity) {
    require_auth( owner );

    _check_amount( quantity );
    _sub_deposit( owner, quantity );

    TRANSFER( _gstate.bank, owner, quantity, "withdraw" )
}

} //rdn namespace
