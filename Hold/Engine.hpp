#ifndef HOLD_ENGINE_HPP
#define HOLD_ENGINE_HPP

#include"Hold/Decision.hpp"
#include"Hold/Invoice.hpp"
#include"Hold/Journal.hpp"
#include"Hold/Policy.hpp"
#include"Hold/Store.hpp"
#include<cstdint>
#include<memory>
#include<vector>

namespace Ev { template<typename a> class Io; }
namespace Hold { class ResolverIF; }
namespace Ln { namespace HtlcAccepted { struct Request; }}
namespace S { class Bus; }
namespace Sqlite3 { class Db; }

namespace Hold {

/** class Hold::Engine
 *
 * @brief the hold invoice state machine.
 *
 * @desc Every change to an invoice or its HTLCs goes
 * through here, serialized per payment hash, and
 * committed in a single database transaction.
 * Right after each commit the transitions are
 * appended to the journal, and only then are held
 * HTLCs resolved.
 *
 * Refused operations throw `Hold::Refused`; database
 * errors propagate as they are.
 */
class Engine {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Engine() =delete;
	Engine(Engine const&) =delete;

	Engine( S::Bus& bus
	      , Sqlite3::Db db
	      , Journal& journal
	      , ResolverIF& resolver
	      , Policy policy = Policy()
	      );
	Engine(Engine&&);
	~Engine();

	/* Create the tables if needed.  */
	Ev::Io<void> init();

	Policy const& policy() const;
	/* Best block height seen so far.  */
	std::uint32_t height() const;

	/** Hold::Engine::htlc
	 *
	 * @brief decide what to do with an incoming HTLC.
	 *
	 * @desc An HTLC told to `hold` is later resolved
	 * through the `Hold::ResolverIF`.
	 */
	Ev::Io<Decision> htlc(Ln::HtlcAccepted::Request const& req);

	/* Start tracking a new unpaid invoice.  Returns the
	 * new id.  */
	Ev::Io<std::uint64_t> add_invoice(Invoice inv);

	Ev::Io<void> settle(Ln::Preimage preimage);
	Ev::Io<void> cancel(Sha256::Hash payment_hash);

	Ev::Io<std::vector<Invoice>> list(Store::Filter filter);

	/* Delete cancelled invoices older than the given
	 * number of seconds.  Returns the number deleted.  */
	Ev::Io<std::uint64_t> clean(std::uint64_t age);

	/** Hold::Engine::block
	 *
	 * @brief inform of a new block, failing HTLCs that
	 * are too close to their expiry.
	 */
	Ev::Io<void> block(std::uint32_t height);

	/** Hold::Engine::sweep_mpp
	 *
	 * @brief fail the parts of unpaid invoices that
	 * have not seen a new part since `now - mpp_timeout`.
	 */
	Ev::Io<void> sweep_mpp(double now);

	struct TrackStart {
		/* States the invoice has already been in.  */
		std::vector<State> states;
		/* Later invoice transitions.  */
		std::unique_ptr<Journal::Subscription> sub;
	};
	/** Hold::Engine::track
	 *
	 * @brief replay the path of one invoice and
	 * follow it.
	 *
	 * @desc An unknown invoice is reported as unpaid.
	 */
	Ev::Io<std::shared_ptr<TrackStart>> track(Sha256::Hash payment_hash);

	struct TrackAllStart {
		/* Current state of each existing invoice in the
		 * filter.  Empty without a filter.  */
		std::vector<Transition> catchup;
		/* Journal position of the catch-up.  */
		std::uint64_t seq;
		std::unique_ptr<Journal::Subscription> sub;
	};
	/* A null `hashes` follows every invoice.  */
	Ev::Io<std::shared_ptr<TrackAllStart>>
	track_all( std::shared_ptr<std::vector<Sha256::Hash>> hashes
		 , bool include_htlcs = false
		 );

	/* Filter of invoice transitions, optionally with
	 * HTLC transitions, of the given hashes or of all
	 * if null.  */
	static
	Journal::Filter
	transition_filter( std::shared_ptr<std::vector<Sha256::Hash>> hashes
			 , bool include_htlcs
			 );
};

}

#endif /* !defined(HOLD_ENGINE_HPP) */
