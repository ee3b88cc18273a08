#ifndef HOLD_MOD_INVOICEENGINE_HPP
#define HOLD_MOD_INVOICEENGINE_HPP

#include<memory>

namespace S { class Bus; }

namespace Hold { namespace Mod {

/** class Hold::Mod::InvoiceEngine
 *
 * @brief owns the `Hold::Engine` and its journal.
 *
 * @desc Opens the engine on `Hold::Msg::Init`, with
 * the policy of the preceding
 * `Hold::Msg::PolicyResource`, then raises
 * `Hold::Msg::EngineReady`.
 * Forwards blocks to the engine, and turns engine
 * resolutions into `Hold::Msg::ReleaseHtlc`.
 */
class InvoiceEngine {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	InvoiceEngine() =delete;
	InvoiceEngine(InvoiceEngine const&) =delete;

	explicit
	InvoiceEngine(S::Bus& bus);
	InvoiceEngine(InvoiceEngine&&);
	~InvoiceEngine();
};

}}

#endif /* !defined(HOLD_MOD_INVOICEENGINE_HPP) */
