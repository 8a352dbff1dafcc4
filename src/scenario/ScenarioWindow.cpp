//
//  ScenarioWindow.cpp
//  mgmpc
//

#include "ScenarioWindow.hpp"
#include "../errors.hpp"
#include "../misc.hpp"

ScenarioWindow::ScenarioWindow(int beginHour, const vector<double> &load, const vector<double> &pv, const vector<double> &wind,
							   const vector<double> &importPrice, const vector<double> &exportPrice, const SystemParams &sys)
	: begin(beginHour), load_(load), pv_(pv), wind_(wind), importPrice_(importPrice), exportPrice_(exportPrice), sys_(sys) {

	if ( load_.empty() )
		throw InputShapeError("window starting at hour " + numToStr(beginHour) + " has no hours");

	size_t H = load_.size();
	if ( pv_.size() != H || wind_.size() != H || importPrice_.size() != H || exportPrice_.size() != H )
		throw InputShapeError("window starting at hour " + numToStr(beginHour) + " has arrays of different lengths");

	if ( sys_.timestep <= 0 )
		throw ConfigError("timestep must be positive");
}

double ScenarioWindow::peakLoad() const {
	return maximum(load_);
}
