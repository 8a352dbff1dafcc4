//
//  HorizonModel.cpp
//  mgmpc
//

#include "HorizonModel.hpp"
#include "errors.hpp"
#include "misc.hpp"

HorizonModel::HorizonModel(const ScenarioWindow &window, double socInit) : window(window), socInit(socInit) {
	const SystemParams &sys = window.params();

	checkParams(sys);
	if ( socInit < -EPSzero || socInit > sys.storageCapacity + EPSzero )
		throw ConfigError("initial storage level " + numToStr(socInit) + " MWh outside [0, " + numToStr(sys.storageCapacity) + "]");

	numPeriods = window.length();
}

HorizonModel::~HorizonModel() {}

/****************************************************************************
 * formulate
 * - Per period: grid import/export, electrolyzer, fuel cell, diesel and
 * curtailment powers, the storage level at the end of the period, and the
 * on/off states gating the minimum technical powers.
 * - The initial storage level enters the first storage row as a constant.
 ****************************************************************************/
void HorizonModel::formulate() {
	char elemName[NAMESIZE];
	const SystemParams &sys = window.params();
	double dt = window.dt();

	/**** Decision variables *****/
	pImport.resize(numPeriods);	pExport.resize(numPeriods);
	pEly.resize(numPeriods);	pFc.resize(numPeriods);	pDg.resize(numPeriods);
	pCurt.resize(numPeriods);	soc.resize(numPeriods);
	uEly.resize(numPeriods);	uFc.resize(numPeriods);	uDg.resize(numPeriods);
	if ( sys.gridExclusive ) {
		uImport.resize(numPeriods);	uExport.resize(numPeriods);
	}

	for ( int t = 0; t < numPeriods; t++ ) {
		/* Grid: bounded by the fixed maxima, or by the direction flags below */
		double impUB = sys.gridExclusive ? MilpInfinity : sys.importMax;
		double expUB = sys.gridExclusive ? MilpInfinity : sys.exportMax;

		sprintf(elemName, "pImport(%d)", t);
		pImport[t] = prog.addVar(elemName, 0, impUB, window.importPrice(t) * dt, CONTINUOUS);
		sprintf(elemName, "pExport(%d)", t);
		pExport[t] = prog.addVar(elemName, 0, expUB, -window.exportPrice(t) * dt, CONTINUOUS);

		/* Hydrogen chain and diesel */
		sprintf(elemName, "pEly(%d)", t);
		pEly[t] = prog.addVar(elemName, 0, MilpInfinity, 0, CONTINUOUS);
		sprintf(elemName, "pFc(%d)", t);
		pFc[t] = prog.addVar(elemName, 0, MilpInfinity, 0, CONTINUOUS);
		sprintf(elemName, "pDg(%d)", t);
		pDg[t] = prog.addVar(elemName, 0, MilpInfinity, (sys.fuelPrice / sys.etaDg) * dt, CONTINUOUS);

		/* Curtailment absorbs any surplus, including the one forced by minimum powers */
		sprintf(elemName, "pCurt(%d)", t);
		pCurt[t] = prog.addVar(elemName, 0, MilpInfinity, sys.curtailPenalty * dt, CONTINUOUS);

		sprintf(elemName, "soc(%d)", t);
		soc[t] = prog.addVar(elemName, 0, sys.storageCapacity, 0, CONTINUOUS);

		sprintf(elemName, "uEly(%d)", t);
		uEly[t] = prog.addVar(elemName, 0, 1, 0, BINARY);
		sprintf(elemName, "uFc(%d)", t);
		uFc[t] = prog.addVar(elemName, 0, 1, 0, BINARY);
		sprintf(elemName, "uDg(%d)", t);
		uDg[t] = prog.addVar(elemName, 0, 1, 0, BINARY);

		if ( sys.gridExclusive ) {
			sprintf(elemName, "uImport(%d)", t);
			uImport[t] = prog.addVar(elemName, 0, 1, 0, BINARY);
			sprintf(elemName, "uExport(%d)", t);
			uExport[t] = prog.addVar(elemName, 0, 1, 0, BINARY);
		}
	}

	/***** Constraints *****/
	for ( int t = 0; t < numPeriods; t++ ) {
		/* Energy balance: pv + wind + import + diesel + fuel cell = load + electrolyzer + export + curtailment */
		sprintf(elemName, "balance(%d)", t);
		vector< pair<int,double> > bal = { {pImport[t], 1.0}, {pDg[t], 1.0}, {pFc[t], 1.0},
										   {pEly[t], -1.0}, {pExport[t], -1.0}, {pCurt[t], -1.0} };
		prog.addRow(elemName, bal, ROW_EQ, window.load(t) - window.pv(t) - window.wind(t));

		/* Storage dynamics */
		sprintf(elemName, "storage(%d)", t);
		vector< pair<int,double> > st = { {soc[t], 1.0}, {pEly[t], -dt * sys.etaEly}, {pFc[t], dt / sys.etaFc} };
		if ( t == 0 ) {
			prog.addRow(elemName, st, ROW_EQ, socInit);
		}
		else {
			st.push_back( make_pair(soc[t-1], -1.0) );
			prog.addRow(elemName, st, ROW_EQ, 0.0);
		}

		/* Grid direction */
		if ( sys.gridExclusive ) {
			sprintf(elemName, "importMax(%d)", t);
			prog.addRow(elemName, { {pImport[t], 1.0}, {uImport[t], -sys.importMax} }, ROW_LE, 0.0);
			sprintf(elemName, "exportMax(%d)", t);
			prog.addRow(elemName, { {pExport[t], 1.0}, {uExport[t], -sys.exportMax} }, ROW_LE, 0.0);
			sprintf(elemName, "gridExcl(%d)", t);
			prog.addRow(elemName, { {uImport[t], 1.0}, {uExport[t], 1.0} }, ROW_LE, 1.0);
		}
	}

	addUnitBounds("ely", pEly, uEly, sys.elyNominal, sys.elyMin);
	addUnitBounds("fc", pFc, uFc, sys.fcNominal, sys.fcMin);
	addUnitBounds("dg", pDg, uDg, sys.dgNominal, sys.dgMin);
}//END formulate()

/* P <= nominal * u and P >= minimum * u, for every period */
void HorizonModel::addUnitBounds(const char *unit, vector<int> &p, vector<int> &u, double nominal, double minimum) {
	char elemName[NAMESIZE];

	for ( int t = 0; t < numPeriods; t++ ) {
		sprintf(elemName, "%sMax(%d)", unit, t);
		prog.addRow(elemName, { {p[t], 1.0}, {u[t], -nominal} }, ROW_LE, 0.0);

		if ( minimum >= EPSzero ) {	// if no minimum power requirement, skip the constraint
			sprintf(elemName, "%sMin(%d)", unit, t);
			prog.addRow(elemName, { {p[t], 1.0}, {u[t], -minimum} }, ROW_GE, 0.0);
		}
	}
}

/****************************************************************************
 * extract
 * - Maps the backend values onto dispatch decisions.
 * - Powers are clipped at zero and the storage level to its bounds, which
 * only removes solver round-off.
 * - A unit (or grid direction) is reported on only if it carries power, so
 * that equally optimal flag patterns read the same from every backend.
 ****************************************************************************/
HorizonResult HorizonModel::extract(const BackendResult &sol, const string &backend) const {
	const SystemParams &sys = window.params();
	const double onTol = 1e-9;

	HorizonResult result;
	result.beginHour = window.beginHour();
	result.objValue = sol.objValue;
	result.backend = backend;
	result.dispatch.resize(numPeriods);

	const vector<double> &x = sol.values;
	for ( int t = 0; t < numPeriods; t++ ) {
		DispatchDecision &d = result.dispatch[t];

		d.pImport	= max(0.0, x[ pImport[t] ]);
		d.pExport	= max(0.0, x[ pExport[t] ]);
		d.pEly		= max(0.0, x[ pEly[t] ]);
		d.pFc		= max(0.0, x[ pFc[t] ]);
		d.pDg		= max(0.0, x[ pDg[t] ]);
		d.pCurt		= max(0.0, x[ pCurt[t] ]);
		d.soc		= min(sys.storageCapacity, max(0.0, x[ soc[t] ]));

		d.uEly	= x[ uEly[t] ] > 0.5 && d.pEly > onTol;
		d.uFc	= x[ uFc[t] ] > 0.5 && d.pFc > onTol;
		d.uDg	= x[ uDg[t] ] > 0.5 && d.pDg > onTol;
		if ( sys.gridExclusive ) {
			d.uImport = x[ uImport[t] ] > 0.5 && d.pImport > onTol;
			d.uExport = x[ uExport[t] ] > 0.5 && d.pExport > onTol;
		}
		else {
			d.uImport = d.pImport > onTol;
			d.uExport = d.pExport > onTol;
		}

		result.maxBalanceResidual = max(result.maxBalanceResidual, fabs(balanceResidual(d, t)));
	}

	return result;
}//END extract()

/* Supply minus demand of period _t_, in MW */
double HorizonModel::balanceResidual(const DispatchDecision &d, int t) const {
	return window.pv(t) + window.wind(t) + d.pImport + d.pDg + d.pFc
		 - window.load(t) - d.pEly - d.pExport - d.pCurt;
}
