//
//  horizon_test.h
//  mgmpc
//

#ifndef HORIZON_TEST_H
#define HORIZON_TEST_H

#include <cmath>
#include <sstream>

#include "test_helper.h"
#include "HorizonModel.hpp"
#include "HorizonSolver.hpp"

class horizon_tests : public test_helper
{
	BackendChain *chain;
	ostringstream log;

public:
	void setUp(){
		chain = new BackendChain(vector<string>(1, "cplex"));
	}

	void tearDown(){
		delete chain;
	}

	HorizonResult solveWindow(const ScenarioWindow &window, double socInit){
		MilpHorizonSolver solver(*chain, defaultOptions(), log);
		return solver.solve(window, socInit);
	}

	void test_import_covers_deficit(){
		SystemParams sys = gridOnlySystem();
		HorizonResult res = solveWindow(singleHour(10, 4, 2, 100, 50, sys), 0.0);

		CPPUNIT_ASSERT_EQUAL(1, (int) res.dispatch.size());
		const DispatchDecision &d = res.dispatch[0];
		CPPUNIT_ASSERT_DOUBLES_EQUAL(4.0, d.pImport, VALIDATE_THRESHOLD);
		CPPUNIT_ASSERT_DOUBLES_EQUAL(0.0, d.pExport, VALIDATE_THRESHOLD);
		CPPUNIT_ASSERT_DOUBLES_EQUAL(0.0, d.pEly, VALIDATE_THRESHOLD);
		CPPUNIT_ASSERT_DOUBLES_EQUAL(0.0, d.pFc, VALIDATE_THRESHOLD);
		CPPUNIT_ASSERT_DOUBLES_EQUAL(0.0, d.pDg, VALIDATE_THRESHOLD);
		CPPUNIT_ASSERT_DOUBLES_EQUAL(0.0, d.pCurt, VALIDATE_THRESHOLD);
		CPPUNIT_ASSERT_DOUBLES_EQUAL(400.0, res.objValue, 1e-4);
		CPPUNIT_ASSERT(d.uImport);
		CPPUNIT_ASSERT(!d.uExport);
		CPPUNIT_ASSERT_EQUAL(string("cplex"), res.backend);
	}

	void test_surplus_fills_electrolyzer(){
		SystemParams sys = gridOnlySystem();
		sys.storageCapacity = 10.0;
		sys.elyNominal = 8.0;	sys.elyMin = 0.0;	sys.etaEly = 0.7;
		sys.exportMax = 0.0;

		HorizonResult res = solveWindow(singleHour(2, 10, 0, 100, 50, sys), 0.0);
		const DispatchDecision &d = res.dispatch[0];
		CPPUNIT_ASSERT_DOUBLES_EQUAL(8.0, d.pEly, VALIDATE_THRESHOLD);
		CPPUNIT_ASSERT_DOUBLES_EQUAL(0.0, d.pCurt, VALIDATE_THRESHOLD);
		CPPUNIT_ASSERT_DOUBLES_EQUAL(0.7*8.0*sys.timestep, d.soc, VALIDATE_THRESHOLD);
		CPPUNIT_ASSERT_DOUBLES_EQUAL(0.0, res.objValue, 1e-4);
		CPPUNIT_ASSERT(d.uEly);
	}

	void test_full_storage_curtails(){
		SystemParams sys = gridOnlySystem();
		sys.storageCapacity = 5.0;
		sys.elyNominal = 8.0;	sys.elyMin = 0.0;	sys.etaEly = 0.7;
		sys.exportMax = 0.0;

		HorizonResult res = solveWindow(singleHour(2, 10, 0, 100, 50, sys), 0.0);
		const DispatchDecision &d = res.dispatch[0];
		CPPUNIT_ASSERT_DOUBLES_EQUAL(5.0/0.7, d.pEly, VALIDATE_THRESHOLD);
		CPPUNIT_ASSERT_DOUBLES_EQUAL(8.0 - 5.0/0.7, d.pCurt, VALIDATE_THRESHOLD);
		CPPUNIT_ASSERT_DOUBLES_EQUAL(5.0, d.soc, VALIDATE_THRESHOLD);
		CPPUNIT_ASSERT_DOUBLES_EQUAL(sys.curtailPenalty*(8.0 - 5.0/0.7), res.objValue, 1e-4);
	}

	void test_balance_and_bounds_hold_every_hour(){
		SystemParams sys = hydrogenSystem();
		ScenarioTable table = dayTable(24);
		ScenarioWindow window = table.window(0, 24, sys);
		double socInit = 2.0;

		HorizonResult res = solveWindow(window, socInit);
		CPPUNIT_ASSERT_EQUAL(24, (int) res.dispatch.size());

		double prevSoc = socInit;
		for (int t=0; t<24; t++) {
			const DispatchDecision &d = res.dispatch[t];
			double residual = window.pv(t) + window.wind(t) + d.pImport + d.pDg + d.pFc
							- window.load(t) - d.pEly - d.pExport - d.pCurt;
			CPPUNIT_ASSERT_DOUBLES_EQUAL(0.0, residual, 1e-5);

			CPPUNIT_ASSERT(d.pImport >= 0 && d.pExport >= 0 && d.pEly >= 0 && d.pFc >= 0 && d.pDg >= 0 && d.pCurt >= 0);
			CPPUNIT_ASSERT(d.soc >= 0 && d.soc <= sys.storageCapacity);

			/* storage recomputed from the committed powers */
			double expected = prevSoc + sys.timestep*(sys.etaEly*d.pEly - d.pFc/sys.etaFc);
			CPPUNIT_ASSERT_DOUBLES_EQUAL(expected, d.soc, 1e-5);
			prevSoc = d.soc;

			/* minimum technical powers follow the on/off states */
			if ( d.uEly ) CPPUNIT_ASSERT(d.pEly >= sys.elyMin - VALIDATE_THRESHOLD && d.pEly <= sys.elyNominal + VALIDATE_THRESHOLD);
			else          CPPUNIT_ASSERT_DOUBLES_EQUAL(0.0, d.pEly, VALIDATE_THRESHOLD);
			if ( d.uFc )  CPPUNIT_ASSERT(d.pFc >= sys.fcMin - VALIDATE_THRESHOLD && d.pFc <= sys.fcNominal + VALIDATE_THRESHOLD);
			else          CPPUNIT_ASSERT_DOUBLES_EQUAL(0.0, d.pFc, VALIDATE_THRESHOLD);
			if ( d.uDg )  CPPUNIT_ASSERT(d.pDg >= sys.dgMin - VALIDATE_THRESHOLD && d.pDg <= sys.dgNominal + VALIDATE_THRESHOLD);
			else          CPPUNIT_ASSERT_DOUBLES_EQUAL(0.0, d.pDg, VALIDATE_THRESHOLD);

			/* one grid direction per hour */
			CPPUNIT_ASSERT(d.pImport < VALIDATE_THRESHOLD || d.pExport < VALIDATE_THRESHOLD);
			CPPUNIT_ASSERT(d.pImport <= sys.importMax + VALIDATE_THRESHOLD);
			CPPUNIT_ASSERT(d.pExport <= sys.exportMax + VALIDATE_THRESHOLD);
		}
		CPPUNIT_ASSERT(res.maxBalanceResidual < 1e-5);
	}

	void test_same_window_same_plan(){
		SystemParams sys = hydrogenSystem();
		ScenarioTable table = dayTable(12);
		ScenarioWindow window = table.window(0, 12, sys);

		HorizonResult first = solveWindow(window, 1.0);
		HorizonResult second = solveWindow(window, 1.0);

		CPPUNIT_ASSERT_DOUBLES_EQUAL(first.objValue, second.objValue, 1e-6);
		for (int t=0; t<12; t++) {
			CPPUNIT_ASSERT_DOUBLES_EQUAL(first.dispatch[t].pImport, second.dispatch[t].pImport, 1e-6);
			CPPUNIT_ASSERT_DOUBLES_EQUAL(first.dispatch[t].pEly, second.dispatch[t].pEly, 1e-6);
			CPPUNIT_ASSERT_DOUBLES_EQUAL(first.dispatch[t].pFc, second.dispatch[t].pFc, 1e-6);
			CPPUNIT_ASSERT_DOUBLES_EQUAL(first.dispatch[t].soc, second.dispatch[t].soc, 1e-6);
		}
	}

	void test_grid_exclusive_blocks_arbitrage(){
		SystemParams sys = gridOnlySystem();
		sys.importMax = 5.0;	sys.exportMax = 5.0;

		/* selling is dearer than buying: without exclusion both directions run at full power */
		sys.gridExclusive = false;
		HorizonResult open = solveWindow(singleHour(0, 0, 0, 100, 150, sys), 0.0);
		CPPUNIT_ASSERT_DOUBLES_EQUAL(5.0, open.dispatch[0].pImport, VALIDATE_THRESHOLD);
		CPPUNIT_ASSERT_DOUBLES_EQUAL(5.0, open.dispatch[0].pExport, VALIDATE_THRESHOLD);
		CPPUNIT_ASSERT_DOUBLES_EQUAL(-250.0, open.objValue, 1e-4);

		sys.gridExclusive = true;
		HorizonResult exclusive = solveWindow(singleHour(0, 0, 0, 100, 150, sys), 0.0);
		CPPUNIT_ASSERT_DOUBLES_EQUAL(0.0, exclusive.dispatch[0].pImport, VALIDATE_THRESHOLD);
		CPPUNIT_ASSERT_DOUBLES_EQUAL(0.0, exclusive.dispatch[0].pExport, VALIDATE_THRESHOLD);
		CPPUNIT_ASSERT_DOUBLES_EQUAL(0.0, exclusive.objValue, 1e-4);
	}

	void test_diesel_minimum_power(){
		SystemParams sys = gridOnlySystem();
		sys.importMax = 0.0;	sys.exportMax = 0.0;
		sys.dgNominal = 5.0;	sys.dgMin = 2.0;	sys.fuelPrice = 60.0;

		/* 1 MW deficit: the diesel runs at its minimum and the excess is curtailed */
		HorizonResult res = solveWindow(singleHour(3, 2, 0, 100, 50, sys), 0.0);
		const DispatchDecision &d = res.dispatch[0];
		CPPUNIT_ASSERT(d.uDg);
		CPPUNIT_ASSERT_DOUBLES_EQUAL(2.0, d.pDg, VALIDATE_THRESHOLD);
		CPPUNIT_ASSERT_DOUBLES_EQUAL(1.0, d.pCurt, VALIDATE_THRESHOLD);
		CPPUNIT_ASSERT_DOUBLES_EQUAL(2.0*60.0/sys.etaDg + 1.0*sys.curtailPenalty, res.objValue, 1e-4);
	}

	void test_minimum_power_without_renewables(){
		SystemParams sys = gridOnlySystem();
		sys.importMax = 0.0;	sys.exportMax = 0.0;
		sys.dgNominal = 5.0;	sys.dgMin = 2.0;	sys.fuelPrice = 60.0;

		/* no sun, no wind, no grid: the diesel floor exceeds the load and the rest is curtailed */
		HorizonResult res = solveWindow(singleHour(1, 0, 0, 100, 50, sys), 0.0);
		const DispatchDecision &d = res.dispatch[0];
		CPPUNIT_ASSERT(d.uDg);
		CPPUNIT_ASSERT_DOUBLES_EQUAL(2.0, d.pDg, VALIDATE_THRESHOLD);
		CPPUNIT_ASSERT_DOUBLES_EQUAL(1.0, d.pCurt, VALIDATE_THRESHOLD);
		CPPUNIT_ASSERT_DOUBLES_EQUAL(0.0, d.pImport, VALIDATE_THRESHOLD);
		CPPUNIT_ASSERT_DOUBLES_EQUAL(2.0*60.0/sys.etaDg + 1.0*sys.curtailPenalty, res.objValue, 1e-4);
		CPPUNIT_ASSERT(res.maxBalanceResidual < 1e-5);
	}

	void test_infeasible_window_reports_hour(){
		SystemParams sys = gridOnlySystem();
		sys.importMax = 0.0;	sys.exportMax = 0.0;

		ScenarioTable table;
		table.firstHour = 40;
		table.addHour(10, 0, 0, 100, 50);
		table.addHour(10, 0, 0, 100, 50);
		ScenarioWindow window = table.window(40, 2, sys);

		try {
			solveWindow(window, 0.0);
			CPPUNIT_FAIL("an uncoverable load must be infeasible");
		}
		catch (InfeasibleError &e) {
			CPPUNIT_ASSERT_EQUAL(40, e.beginHour);
		}
	}

	void test_initial_level_outside_storage(){
		SystemParams sys = gridOnlySystem();
		sys.storageCapacity = 5.0;
		CPPUNIT_ASSERT_THROW(HorizonModel(singleHour(1, 0, 0, 100, 50, sys), 6.0), ConfigError);
		CPPUNIT_ASSERT_THROW(HorizonModel(singleHour(1, 0, 0, 100, 50, sys), -1.0), ConfigError);
	}

	void test_model_size(){
		SystemParams sys = hydrogenSystem();
		ScenarioTable table = dayTable(6);
		HorizonModel model(table.window(0, 6, sys), 0.0);
		model.formulate();

		/* 7 continuous and 5 binary variables per hour */
		CPPUNIT_ASSERT_EQUAL(6*12, model.program().numVars());
		CPPUNIT_ASSERT_EQUAL(6*5, model.program().numBinaries());
		/* balance, storage, 3 grid rows, 2 rows per unit */
		CPPUNIT_ASSERT_EQUAL(6*11, model.program().numRows());

		sys.gridExclusive = false;
		sys.elyMin = 0.0;
		HorizonModel relaxed(table.window(0, 6, sys), 0.0);
		relaxed.formulate();
		CPPUNIT_ASSERT_EQUAL(6*10, relaxed.program().numVars());
		CPPUNIT_ASSERT_EQUAL(6*7, relaxed.program().numRows());
	}

	CPPUNIT_TEST_SUITE(horizon_tests);
	CPPUNIT_TEST(test_import_covers_deficit);
	CPPUNIT_TEST(test_surplus_fills_electrolyzer);
	CPPUNIT_TEST(test_full_storage_curtails);
	CPPUNIT_TEST(test_balance_and_bounds_hold_every_hour);
	CPPUNIT_TEST(test_same_window_same_plan);
	CPPUNIT_TEST(test_grid_exclusive_blocks_arbitrage);
	CPPUNIT_TEST(test_diesel_minimum_power);
	CPPUNIT_TEST(test_minimum_power_without_renewables);
	CPPUNIT_TEST(test_infeasible_window_reports_hour);
	CPPUNIT_TEST(test_initial_level_outside_storage);
	CPPUNIT_TEST(test_model_size);
	CPPUNIT_TEST_SUITE_END();
};

#endif
