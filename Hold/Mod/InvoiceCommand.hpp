#ifndef HOLD_MOD_INVOICECOMMAND_HPP
#define HOLD_MOD_INVOICECOMMAND_HPP

#include<memory>

namespace S { class Bus; }

namespace Hold { namespace Mod {

/** class Hold::Mod::InvoiceCommand
 *
 * @brief the `holdinvoice` and `injectholdinvoice`
 * commands, which start tracking a new hold invoice.
 *
 * @desc `holdinvoice` builds the invoice and has the
 * node sign it with `signinvoice`.
 * `injectholdinvoice` takes an invoice made
 * elsewhere, as long as it pays us or routes through
 * us.
 */
class InvoiceCommand {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	InvoiceCommand() =delete;
	InvoiceCommand(InvoiceCommand const&) =delete;

	explicit
	InvoiceCommand(S::Bus& bus);
	InvoiceCommand(InvoiceCommand&&);
	~InvoiceCommand();
};

}}

#endif /* !defined(HOLD_MOD_INVOICECOMMAND_HPP) */
