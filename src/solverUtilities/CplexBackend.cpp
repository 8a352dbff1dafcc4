//
//  CplexBackend.cpp
//  mgmpc
//

#include <ilcplex/ilocplex.h>

#include <sstream>

#include "CplexBackend.hpp"
#include "../config.hpp"

CplexBackend::CplexBackend() {}

CplexBackend::~CplexBackend() {}

string CplexBackend::name() const {
	return "cplex";
}

/****************************************************************************
 * solve
 * - Translates the program into a Concert model, solves it and reads the
 * values back in variable order.
 * - Exceptions raised by Concert (missing license, out of memory, ...) are
 * reported as SOLVE_FAILED so that the next backend gets its turn.
 ****************************************************************************/
BackendResult CplexBackend::solve(const MilpProgram &prog, const SolveOptions &opts, ostream &log) {
	BackendResult result;
	IloEnv env;

	try {
		IloModel model(env);

		/* variables */
		IloNumVarArray x(env);
		for (int j=0; j<prog.numVars(); j++) {
			const MilpVar &v = prog.var(j);
			IloNum lb = (v.lb <= -MilpInfinity) ? -IloInfinity : v.lb;
			IloNum ub = (v.ub >= MilpInfinity) ? IloInfinity : v.ub;
			x.add( IloNumVar(env, lb, ub, (v.type == BINARY) ? ILOBOOL : ILOFLOAT, v.name.c_str()) );
		}
		model.add(x);

		/* constraints */
		for (int i=0; i<prog.numRows(); i++) {
			const MilpRow &r = prog.row(i);
			IloExpr expr (env);
			for (unsigned int k=0; k<r.idx.size(); k++)
				expr += r.coef[k] * x[ r.idx[k] ];

			IloRange c;
			switch (r.sense) {
			case ROW_EQ:	c = IloRange(env, r.rhs, expr, r.rhs, r.name.c_str());			break;
			case ROW_LE:	c = IloRange(env, -IloInfinity, expr, r.rhs, r.name.c_str());	break;
			case ROW_GE:	c = IloRange(env, r.rhs, expr, IloInfinity, r.name.c_str());	break;
			}
			model.add(c);
			expr.end();
		}

		/* objective */
		IloExpr cost (env);
		for (int j=0; j<prog.numVars(); j++) {
			if ( prog.var(j).obj != 0 )
				cost += prog.var(j).obj * x[j];
		}
		model.add( IloMinimize(env, cost) );
		cost.end();

		IloCplex cplex(model);
		cplex.setOut(log);
		cplex.setWarning(log);
		cplex.setParam(IloCplex::TiLim, opts.timeLimit);
		cplex.setParam(IloCplex::EpGap, opts.mipGap);
		cplex.setParam(IloCplex::Threads, opts.threads);

		cplex.solve();

		IloAlgorithm::Status status = cplex.getStatus();
		if ( status == IloAlgorithm::Optimal ) {
			result.status = SOLVE_OPTIMAL;
			result.objValue = cplex.getObjValue();
			result.values.resize(prog.numVars());
			for (int j=0; j<prog.numVars(); j++)
				result.values[j] = cplex.getValue(x[j]);
		}
		else if ( status == IloAlgorithm::Infeasible || status == IloAlgorithm::InfeasibleOrUnbounded ) {
			result.status = SOLVE_INFEASIBLE;
		}
		else if ( status == IloAlgorithm::Unbounded ) {
			result.status = SOLVE_UNBOUNDED;
		}
		else {
			// time limit with or without an incumbent, aborted or numerical trouble
			ostringstream ss;
			ss << "cplex stopped with status " << cplex.getCplexStatus();
			result.status = SOLVE_FAILED;
			result.message = ss.str();
		}
	}
	catch (IloException &e) {
		result.status = SOLVE_FAILED;
		result.message = string("cplex: ") + e.getMessage();
	}

	env.end();
	return result;
}//END solve()
