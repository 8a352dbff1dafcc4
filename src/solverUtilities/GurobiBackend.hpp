//
//  GurobiBackend.hpp
//  mgmpc
//

#ifndef GurobiBackend_hpp
#define GurobiBackend_hpp

#include "MilpBackend.hpp"

/* Gurobi through its C++ interface. A fresh environment is started for every solve. */
class GurobiBackend : public MilpBackend {

public:
	GurobiBackend ();
	~GurobiBackend ();

	string name () const;
	BackendResult solve (const MilpProgram &prog, const SolveOptions &opts, ostream &log);
};

#endif /* GurobiBackend_hpp */
