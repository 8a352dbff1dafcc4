#ifndef _MISC_H
#define _MISC_H

#include <iostream>
#include <sstream>
#include <iomanip>
#include <fstream>
#include <vector>
#include <algorithm>
#include <cmath>
#include <stdio.h>
#include <string.h>
#include <stdlib.h>

using namespace std;

// Commonly used functions

/****************************************************************************
 * numToStr
 * - Converts numbers to string
 *****************************************************************************/
template <typename T>
string numToStr (T Number) {
	ostringstream ss;
	ss << Number;
	return ss.str();
}

istream& safeGetline(istream& is, string& t);

vector<string> splitString(const string &line, char delimiter);
string trimString(const string &str);

bool open_file (ifstream &file, string filename);
bool open_file (ofstream &file, string filename);

template <class object>
object maximum (const vector<object> &x)
{
	object temp = -999999;
	for (unsigned int i=0; i<x.size(); i++) {
		if (x[i] > temp) temp = x[i];
	}
	return temp;
}

const std::string getCurrentDateTime();

double get_wall_time();

#endif
