#include"Ev/Io.hpp"
#include"Hold/Mod/PolicyHandler.hpp"
#include"Hold/Msg/EndOfOptions.hpp"
#include"Hold/Msg/ManifestOption.hpp"
#include"Hold/Msg/Manifestation.hpp"
#include"Hold/Msg/Option.hpp"
#include"Hold/Msg/PolicyResource.hpp"
#include"Hold/Policy.hpp"
#include"Hold/log.hpp"
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include"S/Bus.hpp"
#include"Util/make_unique.hpp"
#include<cstdint>
#include<cstdlib>
#include<functional>
#include<map>
#include<sstream>

namespace {

/* lightningd has given int options both as numbers
 * and as strings over the years.  Return false if
 * neither, or negative.  */
bool get_count(std::uint64_t& out, Jsmn::Object const& js) {
	auto v = double();
	if (js.is_number()) {
		v = double(js);
	} else if (js.is_string()) {
		auto s = std::string(js);
		if (s.empty())
			return false;
		char* end = nullptr;
		v = std::strtod(s.c_str(), &end);
		if (*end != '\0')
			return false;
	} else
		return false;
	if (v < 0 || v > 4294967295.0)
		return false;
	out = std::uint64_t(v);
	return true;
}

}

namespace Hold { namespace Mod {

class PolicyHandler::Impl {
private:
	S::Bus& bus;
	Hold::Policy policy;

	struct Setting {
		char const* description;
		std::uint64_t dflt;
		/* Smallest usable value.  */
		std::uint64_t min;
		std::function<void(Hold::Policy&, std::uint64_t)> set;
	};
	std::map<std::string, Setting> settings;

	void start() {
		auto const dflt = Hold::Policy();

		settings["hold-mpp-timeout"] = Setting{
			"Seconds without a new part before the parts of "
			"an unpaid hold invoice are failed.",
			std::uint64_t(dflt.mpp_timeout), 1,
			[](Hold::Policy& p, std::uint64_t v) {
				p.mpp_timeout = double(v);
			}
		};
		settings["hold-expiry-deadline"] = Setting{
			"Blocks before their CLTV expiry at which held "
			"HTLCs are failed.  0 disables.",
			dflt.expiry_deadline, 0,
			[](Hold::Policy& p, std::uint64_t v) {
				p.expiry_deadline = std::uint32_t(v);
			}
		};
		settings["hold-overpayment-factor"] = Setting{
			"Accept HTLCs totalling up to this multiple of the "
			"invoice amount.",
			dflt.overpayment_factor, 1,
			[](Hold::Policy& p, std::uint64_t v) {
				p.overpayment_factor = v;
			}
		};
		settings["hold-track-buffer"] = Setting{
			"Updates queued for each tracker before it is "
			"told it lagged.",
			dflt.track_buffer, 1,
			[](Hold::Policy& p, std::uint64_t v) {
				p.track_buffer = std::size_t(v);
			}
		};
		settings["hold-min-final-cltv"] = Setting{
			"Minimum final CLTV delta of created invoices, if "
			"not given to holdinvoice.",
			dflt.min_final_cltv, 1,
			[](Hold::Policy& p, std::uint64_t v) {
				p.min_final_cltv = std::uint32_t(v);
			}
		};

		bus.subscribe<Msg::Manifestation>([this](Msg::Manifestation const&) {
			auto act = Ev::lift();
			for (auto const& s : settings)
				act += bus.raise(Msg::ManifestOption{
					s.first, Msg::OptionType_Int,
					Json::Out::direct(s.second.dflt),
					s.second.description
				});
			return act;
		});
		bus.subscribe<Msg::Option>([this](Msg::Option const& o) {
			auto it = settings.find(o.name);
			if (it == settings.end())
				return Ev::lift();
			auto const& s = it->second;
			auto v = std::uint64_t();
			if (!get_count(v, o.value) || v < s.min) {
				auto os = std::ostringstream();
				os << o.value;
				return Hold::log( bus, Warn
						, "Ignoring %s=%s, using %llu."
						, o.name.c_str()
						, os.str().c_str()
						, (unsigned long long) s.dflt
						);
			}
			s.set(policy, v);
			return Hold::log( bus, Info
					, "%s = %llu"
					, o.name.c_str()
					, (unsigned long long) v
					);
		});
		bus.subscribe<Msg::EndOfOptions>([this](Msg::EndOfOptions const&) {
			return bus.raise(Msg::PolicyResource{policy});
		});
	}

public:
	explicit
	Impl(S::Bus& bus_) : bus(bus_) { start(); }
};

PolicyHandler::PolicyHandler(S::Bus& bus)
	: pimpl(Util::make_unique<Impl>(bus)) { }
PolicyHandler::PolicyHandler(PolicyHandler&&) =default;
PolicyHandler::~PolicyHandler() =default;

}}
