//
//  BackendChain.hpp
//  mgmpc
//

#ifndef BackendChain_hpp
#define BackendChain_hpp

#include <memory>

#include "MilpBackend.hpp"

/* Ordered list of backends. Each solve tries them in order and stops at the first definitive answer. */
class BackendChain {

public:
	BackendChain ();
	explicit BackendChain (const vector<string> &names);	// throws ConfigError for unknown names

	void	add (shared_ptr<MilpBackend> backend);
	int		size () const	{ return (int) backends.size(); }
	vector<string> names () const;

	BackendResult solve (const MilpProgram &prog, const SolveOptions &opts, ostream &log, string &usedBackend);

private:
	vector< shared_ptr<MilpBackend> > backends;
};

shared_ptr<MilpBackend> createBackend (const string &name);
vector<string> availableBackends ();

#endif /* BackendChain_hpp */
