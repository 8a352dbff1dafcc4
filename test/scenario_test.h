//
//  scenario_test.h
//  mgmpc
//

#ifndef SCENARIO_TEST_H
#define SCENARIO_TEST_H

#include "test_helper.h"

class scenario_tests : public test_helper
{
public:
	void setUp(){
	}

	void tearDown(){
		remove("scenario_ok.csv");
		remove("scenario_gap.csv");
		remove("scenario_missing.csv");
	}

	void test_window_copies_hours(){
		ScenarioTable table = dayTable(30);
		SystemParams sys = gridOnlySystem();
		ScenarioWindow window = table.window(10, 5, sys);

		CPPUNIT_ASSERT_EQUAL(10, window.beginHour());
		CPPUNIT_ASSERT_EQUAL(5, window.length());
		for (int t=0; t<5; t++) {
			CPPUNIT_ASSERT_DOUBLES_EQUAL(table.load[10+t], window.load(t), 1e-12);
			CPPUNIT_ASSERT_DOUBLES_EQUAL(table.pv[10+t], window.pv(t), 1e-12);
			CPPUNIT_ASSERT_DOUBLES_EQUAL(table.exportPrice[10+t], window.exportPrice(t), 1e-12);
		}
	}

	void test_window_past_data(){
		ScenarioTable table = dayTable(10);
		SystemParams sys = gridOnlySystem();

		CPPUNIT_ASSERT_THROW(table.window(8, 3, sys), InputShapeError);
		CPPUNIT_ASSERT_THROW(table.window(-1, 3, sys), InputShapeError);
		CPPUNIT_ASSERT_THROW(table.window(0, 0, sys), InputShapeError);
		CPPUNIT_ASSERT_NO_THROW(table.window(7, 3, sys));
	}

	void test_window_shape_checks(){
		SystemParams sys = gridOnlySystem();
		vector<double> three(3, 1.0), two(2, 1.0), none;

		CPPUNIT_ASSERT_THROW(ScenarioWindow(0, three, three, two, three, three, sys), InputShapeError);
		CPPUNIT_ASSERT_THROW(ScenarioWindow(0, none, none, none, none, none, sys), InputShapeError);

		sys.timestep = 0.0;
		CPPUNIT_ASSERT_THROW(ScenarioWindow(0, three, three, three, three, three, sys), ConfigError);
	}

	void test_load_scaling(){
		ScenarioTable table = dayTable(24);
		double ratio = table.load[0] / table.peakLoad();
		table.scaleLoadToNominal(20.0);
		CPPUNIT_ASSERT_DOUBLES_EQUAL(20.0, table.peakLoad(), 1e-9);
		CPPUNIT_ASSERT_DOUBLES_EQUAL(20.0*ratio, table.load[0], 1e-9);

		ScenarioTable empty;
		empty.addHour(0, 1, 1, 10, 5);
		empty.scaleLoadToNominal(20.0);
		CPPUNIT_ASSERT_DOUBLES_EQUAL(0.0, empty.load[0], 1e-12);
	}

	void test_read_table(){
		string fname = writeTempFile("scenario_ok.csv",
			"hour,load_forecast_mw,pv_forecast_mw,wind_forecast_mw,import_price_eur_per_mwh,pun_eur_per_mwh,note\n"
			"5,3.0,0.0,1.5,90,45,night\n"
			"6,3.5,0.5,1.0,95,47.5,dawn\n"
			"7,4.0,2.0,0.5,100,50,\n");

		ScenarioTable table;
		readScenarioTable(fname, table);

		CPPUNIT_ASSERT_EQUAL(5, table.firstHour);
		CPPUNIT_ASSERT_EQUAL(3, table.numHours());
		CPPUNIT_ASSERT_EQUAL(7, table.lastHour());
		CPPUNIT_ASSERT(table.hasHour(6));
		CPPUNIT_ASSERT(!table.hasHour(8));
		CPPUNIT_ASSERT_DOUBLES_EQUAL(3.5, table.load[1], 1e-12);
		CPPUNIT_ASSERT_DOUBLES_EQUAL(2.0, table.pv[2], 1e-12);
		CPPUNIT_ASSERT_DOUBLES_EQUAL(1.5, table.wind[0], 1e-12);
		CPPUNIT_ASSERT_DOUBLES_EQUAL(95.0, table.importPrice[1], 1e-12);
		CPPUNIT_ASSERT_DOUBLES_EQUAL(47.5, table.exportPrice[1], 1e-12);
	}

	void test_read_table_errors(){
		string gap = writeTempFile("scenario_gap.csv",
			"hour,load_forecast_mw,pv_forecast_mw,wind_forecast_mw,import_price_eur_per_mwh,export_price_eur_per_mwh\n"
			"0,3,0,1,90,45\n"
			"2,3,0,1,90,45\n");
		string missing = writeTempFile("scenario_missing.csv",
			"hour,load_forecast_mw,pv_forecast_mw,import_price_eur_per_mwh,export_price_eur_per_mwh\n"
			"0,3,0,90,45\n");

		ScenarioTable table;
		CPPUNIT_ASSERT_THROW(readScenarioTable(gap, table), InputShapeError);
		CPPUNIT_ASSERT_THROW(readScenarioTable(missing, table), InputShapeError);
		CPPUNIT_ASSERT_THROW(readScenarioTable("./no_such_table.csv", table), InputShapeError);
	}

	CPPUNIT_TEST_SUITE(scenario_tests);
	CPPUNIT_TEST(test_window_copies_hours);
	CPPUNIT_TEST(test_window_past_data);
	CPPUNIT_TEST(test_window_shape_checks);
	CPPUNIT_TEST(test_load_scaling);
	CPPUNIT_TEST(test_read_table);
	CPPUNIT_TEST(test_read_table_errors);
	CPPUNIT_TEST_SUITE_END();
};

#endif
