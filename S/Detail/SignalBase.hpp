#ifndef S_DETAIL_SIGNALBASE_HPP
#define S_DETAIL_SIGNALBASE_HPP

namespace S { namespace Detail {

/* Type-erased base of Signal<a>, so that S::Bus can own
 * signals of different types.  */
class SignalBase {
public:
	virtual ~SignalBase() { }
};

}}

#endif /* !defined(S_DETAIL_SIGNALBASE_HPP) */
