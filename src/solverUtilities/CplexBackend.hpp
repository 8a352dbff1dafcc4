//
//  CplexBackend.hpp
//  mgmpc
//

#ifndef CplexBackend_hpp
#define CplexBackend_hpp

#include "MilpBackend.hpp"

/* IBM ILOG CPLEX through Concert Technology. A fresh environment is created for every solve. */
class CplexBackend : public MilpBackend {

public:
	CplexBackend ();
	~CplexBackend ();

	string name () const;
	BackendResult solve (const MilpProgram &prog, const SolveOptions &opts, ostream &log);
};

#endif /* CplexBackend_hpp */
