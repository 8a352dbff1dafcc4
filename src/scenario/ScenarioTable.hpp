//
//  ScenarioTable.hpp
//  mgmpc
//

#ifndef ScenarioTable_hpp
#define ScenarioTable_hpp

#include <string>
#include <vector>

#include "../config.hpp"
#include "ScenarioWindow.hpp"

using namespace std;

/* Hourly forecasts and prices over the whole simulated period. Row k holds hour firstHour+k. */
class ScenarioTable {

public:
	ScenarioTable ();

	int		firstHour;
	vector<double> load;			// MW
	vector<double> pv;				// MW
	vector<double> wind;			// MW
	vector<double> importPrice;		// currency / MWh
	vector<double> exportPrice;		// currency / MWh

	void	addHour (double load, double pv, double wind, double importPrice, double exportPrice);

	int		numHours () const;
	int		lastHour () const;		// last available hour index, firstHour-1 if the table is empty
	bool	hasHour (int hour) const;

	void	check () const;			// throws InputShapeError
	ScenarioWindow window (int beginHour, int length, const SystemParams &sys) const;

	double	peakLoad () const;
	void	scaleLoadToNominal (double nominal);
};

void readScenarioTable (string fname, ScenarioTable &table);

#endif /* ScenarioTable_hpp */
