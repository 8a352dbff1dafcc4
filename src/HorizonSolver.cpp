//
//  HorizonSolver.cpp
//  mgmpc
//

#include "HorizonSolver.hpp"
#include "HorizonModel.hpp"
#include "errors.hpp"
#include "misc.hpp"

MilpHorizonSolver::MilpHorizonSolver(BackendChain &chain, const SolveOptions &opts, ostream &log)
	: chain(chain), opts(opts), log(log), toleranceWarnings(0) {}

/****************************************************************************
 * solve
 * - Builds the horizon model, solves it through the backend chain and
 * extracts the dispatch.
 * - Infeasible and unbounded horizons are reported as errors carrying the
 * first hour of the window; they are never retried on another backend.
 * - An energy balance residual above tolerance is logged, not raised.
 ****************************************************************************/
HorizonResult MilpHorizonSolver::solve(const ScenarioWindow &window, double socInit) {
	HorizonModel model(window, socInit);
	model.formulate();

	string used;
	BackendResult sol = chain.solve(model.program(), opts, log, used);

	if ( sol.status == SOLVE_INFEASIBLE ) {
		log << "Horizon starting at hour " << window.beginHour() << " is infeasible (" << used << ")." << endl;
		throw InfeasibleError(window.beginHour(), used);
	}
	if ( sol.status == SOLVE_UNBOUNDED ) {
		log << "Horizon starting at hour " << window.beginHour() << " is unbounded (" << used << ")." << endl;
		throw UnboundedError(window.beginHour(), used);
	}

	HorizonResult result = model.extract(sol, used);

	double tol = balanceTolCoef * max(1.0, window.peakLoad());
	if ( result.maxBalanceResidual > tol ) {
		toleranceWarnings++;
		log << "Warning:: energy balance residual " << result.maxBalanceResidual << " MW exceeds " << tol
			<< " MW in the horizon starting at hour " << window.beginHour() << "." << endl;
	}

	return result;
}//END solve()
