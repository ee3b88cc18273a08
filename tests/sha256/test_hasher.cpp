#undef NDEBUG
#include"Sha256/Hash.hpp"
#include"Sha256/Hasher.hpp"
#include"Sha256/fun.hpp"
#include<assert.h>

int main() {
	/* From sha256sum.  */
	assert( Sha256::fun("hello", 5)
	     == Sha256::Hash("2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824")
	      );

	auto hasher = Sha256::Hasher();
	hasher.feed("hel", 3);
	hasher.feed("lo", 2);
	assert( hasher.get()
	     == Sha256::Hash("2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824")
	      );
	assert( std::move(hasher).finalize()
	     == Sha256::Hash("2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824")
	      );
	assert(!hasher);

	{
		/* Copies keep the midstate.  */
		auto a = Sha256::Hasher();
		a.feed("the quick brown fox jumps over the lazy dog.", 44);
		auto b = a;
		b.feed("the quick brown fox jumps over the lazy dog.", 44);
		a.feed("the quick brown fox jumps over the lazy dog.", 44);
		auto ha = std::move(a).finalize();
		auto hb = std::move(b).finalize();
		assert(ha == hb);
		assert( ha
		     == Sha256::Hash("9d1b19cd5ff6fc857d99a4be13727f12b9bd6a78a1b8519e18737341d2e8f960")
		      );
	}
	{
		auto h = Sha256::Hash("2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824");
		auto bytes = h.bytes();
		assert(bytes.size() == 32);
		assert(bytes[0] == 0x2c);
		assert(Sha256::Hash::from_bytes(bytes) == h);
	}

	return 0;
}
