//
//  BackendChain.cpp
//  mgmpc
//

#include <exception>
#include <iostream>

#include "BackendChain.hpp"
#include "CplexBackend.hpp"
#ifdef MGMPC_HAVE_GUROBI
#include "GurobiBackend.hpp"
#endif
#include "../errors.hpp"

BackendChain::BackendChain() {}

BackendChain::BackendChain(const vector<string> &names) {
	for (unsigned int i=0; i<names.size(); i++) {
		shared_ptr<MilpBackend> backend = createBackend(names[i]);
		if ( backend )
			backends.push_back(backend);
		else
			cerr << "Warning:: backend " << names[i] << " is not part of this build, skipping it." << endl;
	}

	if ( backends.empty() )
		throw ConfigError("none of the listed backends is part of this build");
}

void BackendChain::add(shared_ptr<MilpBackend> backend) {
	backends.push_back(backend);
}

vector<string> BackendChain::names() const {
	vector<string> res;
	for (unsigned int k=0; k<backends.size(); k++)
		res.push_back(backends[k]->name());
	return res;
}

/****************************************************************************
 * solve
 * - Tries every backend once, in preference order. A backend that throws
 * or gives no definitive answer is skipped; the failure is only written to
 * _log_.
 * - Optimal, infeasible and unbounded are definitive and returned to the
 * caller together with the backend name.
 * - Throws SolverUnavailableError when the list is exhausted.
 ****************************************************************************/
BackendResult BackendChain::solve(const MilpProgram &prog, const SolveOptions &opts, ostream &log, string &usedBackend) {
	vector<string> failures;

	for (unsigned int k=0; k<backends.size(); k++) {
		BackendResult result;
		string name = backends[k]->name();

		try {
			result = backends[k]->solve(prog, opts, log);
		}
		catch (exception &e) {
			result.status = SOLVE_FAILED;
			result.message = name + ": " + e.what();
		}

		if ( result.status == SOLVE_OPTIMAL && (int) result.values.size() != prog.numVars() ) {
			result.status = SOLVE_FAILED;
			result.message = name + " returned " + to_string(result.values.size()) + " values for " + to_string(prog.numVars()) + " variables";
		}

		if ( result.status != SOLVE_FAILED ) {
			usedBackend = name;
			return result;
		}

		failures.push_back(result.message.empty() ? name + ": failed" : result.message);
		log << "Backend " << name << " failed (" << failures.back() << ")";
		if ( k+1 < backends.size() )
			log << ", falling back to " << backends[k+1]->name();
		log << "." << endl;
	}

	throw SolverUnavailableError(failures);
}//END solve()

/* Returns the backend called _name_, or an empty pointer if it is not compiled in */
shared_ptr<MilpBackend> createBackend (const string &name) {
	if ( name == "cplex" )
		return shared_ptr<MilpBackend>(new CplexBackend());
#ifdef MGMPC_HAVE_GUROBI
	if ( name == "gurobi" )
		return shared_ptr<MilpBackend>(new GurobiBackend());
#else
	if ( name == "gurobi" )
		return shared_ptr<MilpBackend>();
#endif
	throw ConfigError("unknown MILP backend " + name);
}

vector<string> availableBackends () {
	vector<string> names = {"cplex"};
#ifdef MGMPC_HAVE_GUROBI
	names.push_back("gurobi");
#endif
	return names;
}
