//
//  GurobiBackend.cpp
//  mgmpc
//

#include "gurobi_c++.h"

#include "GurobiBackend.hpp"
#include "../config.hpp"

GurobiBackend::GurobiBackend() {}

GurobiBackend::~GurobiBackend() {}

string GurobiBackend::name() const {
	return "gurobi";
}

BackendResult GurobiBackend::solve(const MilpProgram &prog, const SolveOptions &opts, ostream &log) {
	BackendResult result;

	try {
		// an empty environment lets us silence the banner before the license check
		GRBEnv env(true);
		env.set(GRB_IntParam_OutputFlag, 0);
		env.start();

		GRBModel model(env);
		model.set(GRB_DoubleParam_TimeLimit, opts.timeLimit);
		model.set(GRB_DoubleParam_MIPGap, opts.mipGap);
		model.set(GRB_IntParam_Threads, opts.threads);

		vector<GRBVar> x (prog.numVars());
		for (int j=0; j<prog.numVars(); j++) {
			const MilpVar &v = prog.var(j);
			double lb = (v.lb <= -MilpInfinity) ? -GRB_INFINITY : v.lb;
			double ub = (v.ub >= MilpInfinity) ? GRB_INFINITY : v.ub;
			x[j] = model.addVar(lb, ub, v.obj, (v.type == BINARY) ? GRB_BINARY : GRB_CONTINUOUS, v.name);
		}

		for (int i=0; i<prog.numRows(); i++) {
			const MilpRow &r = prog.row(i);
			GRBLinExpr expr = 0;
			for (unsigned int k=0; k<r.idx.size(); k++)
				expr += r.coef[k] * x[ r.idx[k] ];

			switch (r.sense) {
			case ROW_EQ:	model.addConstr(expr == r.rhs, r.name);	break;
			case ROW_LE:	model.addConstr(expr <= r.rhs, r.name);	break;
			case ROW_GE:	model.addConstr(expr >= r.rhs, r.name);	break;
			}
		}
		model.set(GRB_IntAttr_ModelSense, GRB_MINIMIZE);

		model.optimize();

		int status = model.get(GRB_IntAttr_Status);
		if ( status == GRB_OPTIMAL ) {
			result.status = SOLVE_OPTIMAL;
			result.objValue = model.get(GRB_DoubleAttr_ObjVal);
			result.values.resize(prog.numVars());
			for (int j=0; j<prog.numVars(); j++)
				result.values[j] = x[j].get(GRB_DoubleAttr_X);
		}
		else if ( status == GRB_INFEASIBLE || status == GRB_INF_OR_UNBD ) {
			result.status = SOLVE_INFEASIBLE;
		}
		else if ( status == GRB_UNBOUNDED ) {
			result.status = SOLVE_UNBOUNDED;
		}
		else {
			result.status = SOLVE_FAILED;
			result.message = "gurobi stopped with status " + to_string(status);
		}

		log << "gurobi: status " << status << ", " << model.get(GRB_DoubleAttr_Runtime) << " s" << endl;
	}
	catch (GRBException &e) {
		result.status = SOLVE_FAILED;
		result.message = "gurobi: " + e.getMessage() + " (code " + to_string(e.getErrorCode()) + ")";
	}

	return result;
}//END solve()
